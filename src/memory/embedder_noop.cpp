#include "engram/memory/embedder_noop.hpp"

namespace engram::memory {

NoopEmbedder::NoopEmbedder(const std::size_t dimensions) : dimensions_(dimensions) {}

std::string_view NoopEmbedder::name() const { return "noop"; }

common::Result<std::vector<float>> NoopEmbedder::embed(std::string_view) {
  return common::Result<std::vector<float>>::failure("embeddings are disabled",
                                                     common::ErrorCode::Unavailable);
}

common::Result<std::vector<std::vector<float>>>
NoopEmbedder::embed_batch(const std::vector<std::string> &) {
  return common::Result<std::vector<std::vector<float>>>::failure(
      "embeddings are disabled", common::ErrorCode::Unavailable);
}

std::size_t NoopEmbedder::dimensions() const { return dimensions_; }

} // namespace engram::memory
