#pragma once

#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace engram::memory {

/// Turns text into a fixed-length vector. Identical input yields an identical
/// vector for the same provider and model. Failures carry ErrorCode::Unavailable.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Provider selected by `embedding.provider`. The openai provider falls back to
/// the local embedder when no API key is configured.
[[nodiscard]] std::unique_ptr<IEmbedder> create_embedder(const config::Config &config);

/// Identifies the vector space of `config`'s provider; cache entries from
/// another space are never reused.
[[nodiscard]] std::string embedding_space_key(const config::Config &config);

} // namespace engram::memory
