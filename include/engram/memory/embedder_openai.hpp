#pragma once

#include "engram/memory/embedder.hpp"
#include "engram/net/http_client.hpp"

#include <cstdint>

namespace engram::memory {

struct OpenAiEmbedderOptions {
  std::string api_key;
  std::string model = "text-embedding-3-small";
  std::size_t dimensions = 1536;
  std::string base_url = "https://api.openai.com";
  std::uint64_t timeout_ms = 5'000;
};

/// OpenAI-compatible `/v1/embeddings` client. Any transport or API problem,
/// including a request that exceeds `timeout_ms`, is reported as Unavailable.
class OpenAiEmbedder final : public IEmbedder {
public:
  explicit OpenAiEmbedder(OpenAiEmbedderOptions options,
                          std::shared_ptr<net::HttpClient> http_client =
                              std::make_shared<net::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  [[nodiscard]] common::Result<std::string> post(const std::string &input_json);

  OpenAiEmbedderOptions options_;
  std::shared_ptr<net::HttpClient> http_client_;
};

} // namespace engram::memory
