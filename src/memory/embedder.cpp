#include "engram/memory/embedder.hpp"

#include "engram/common/fs.hpp"
#include "engram/memory/embedder_local.hpp"
#include "engram/memory/embedder_noop.hpp"
#include "engram/memory/embedder_openai.hpp"
#include "engram/observability/global.hpp"

namespace engram::memory {

namespace {

std::string normalized_provider(const config::Config &config) {
  const std::string provider = common::to_lower(common::trim(config.embedding.provider));
  if (provider == "openai" &&
      (!config.embedding.api_key.has_value() || common::trim(*config.embedding.api_key).empty())) {
    return "local";
  }
  if (provider == "none") {
    return "noop";
  }
  if (provider != "openai" && provider != "noop") {
    return "local";
  }
  return provider;
}

} // namespace

std::unique_ptr<IEmbedder> create_embedder(const config::Config &config) {
  const std::string provider = normalized_provider(config);

  if (provider == "noop") {
    return std::make_unique<NoopEmbedder>(config.embedding.dimensions);
  }

  if (provider == "openai") {
    return std::make_unique<OpenAiEmbedder>(OpenAiEmbedderOptions{
        .api_key = *config.embedding.api_key,
        .model = config.embedding.model,
        .dimensions = config.embedding.dimensions,
        .base_url = config.embedding.base_url,
        .timeout_ms = config.embedding.timeout_ms,
    });
  }

  if (common::to_lower(common::trim(config.embedding.provider)) == "openai") {
    observability::record_fallback("embedder", "no API key for openai; using local embedder");
  }
  return std::make_unique<LocalEmbedder>(config.embedding.dimensions);
}

std::string embedding_space_key(const config::Config &config) {
  const std::string provider = normalized_provider(config);
  if (provider == "openai") {
    return "openai:" + config.embedding.model + ":" + std::to_string(config.embedding.dimensions);
  }
  return provider + ":" + std::to_string(config.embedding.dimensions);
}

} // namespace engram::memory
