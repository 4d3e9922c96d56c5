#pragma once

#include "engram/memory/embedder.hpp"

namespace engram::memory {

/// In-process feature hashing: word tokens and character trigrams are hashed
/// into signed buckets and the result is L2-normalised. No network access.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = kDefaultDimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

  static constexpr std::size_t kDefaultDimensions = 384;

private:
  std::size_t dimensions_;
};

} // namespace engram::memory
