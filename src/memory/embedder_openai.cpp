#include "engram/memory/embedder_openai.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"

#include <sstream>

namespace engram::memory {

namespace {

using EmbeddingResult = common::Result<std::vector<float>>;
using BatchResult = common::Result<std::vector<std::vector<float>>>;

// Every "embedding" array in a response body, in document order. The word
// also appears as a value ("object": "embedding"), so only keys count.
common::Result<std::vector<std::vector<float>>> parse_embeddings(const std::string &body,
                                                                const std::size_t dimensions) {
  static const std::string kKey = "\"embedding\"";
  std::vector<std::vector<float>> out;
  std::size_t from = 0;
  while (true) {
    const auto key_pos = common::json_find_key(body, "embedding", from);
    if (key_pos == std::string::npos) {
      break;
    }
    from = key_pos + kKey.size();
    const std::size_t colon = common::json_skip_ws(body, from);
    if (colon >= body.size() || body[colon] != ':') {
      continue;
    }
    const std::size_t open = common::json_skip_ws(body, colon + 1);
    if (open >= body.size() || body[open] != '[') {
      return BatchResult::failure("invalid embedding array in response",
                                  common::ErrorCode::Unavailable);
    }
    const std::size_t close = common::json_find_matching_token(body, open, '[', ']');
    if (close == std::string::npos) {
      return BatchResult::failure("truncated embedding array in response",
                                  common::ErrorCode::Unavailable);
    }

    auto parsed = common::json_parse_float_array(body.substr(open, close - open + 1));
    if (!parsed.has_value() || parsed->empty()) {
      return BatchResult::failure("invalid embedding array in response",
                                  common::ErrorCode::Unavailable);
    }
    if (parsed->size() != dimensions) {
      parsed->resize(dimensions, 0.0F);
    }
    out.push_back(std::move(*parsed));
    from = close + 1;
  }

  if (out.empty()) {
    return BatchResult::failure("embedding field missing", common::ErrorCode::Unavailable);
  }
  return BatchResult::success(std::move(out));
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(OpenAiEmbedderOptions options,
                               std::shared_ptr<net::HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<std::string> OpenAiEmbedder::post(const std::string &input_json) {
  if (common::trim(options_.api_key).empty()) {
    return common::Result<std::string>::failure("missing API key", common::ErrorCode::Unavailable);
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(options_.model) << "\",";
  if (common::starts_with(options_.model, "text-embedding-3")) {
    body << "\"dimensions\":" << options_.dimensions << ",";
  }
  body << "\"input\":" << input_json;
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + options_.api_key},
  };

  const auto response = http_client_->post_json(options_.base_url + "/v1/embeddings", headers,
                                                body.str(), options_.timeout_ms);

  if (response.timeout) {
    return common::Result<std::string>::failure(
        "embedding request timed out after " + std::to_string(options_.timeout_ms) + "ms",
        common::ErrorCode::Unavailable);
  }
  if (response.network_error) {
    return common::Result<std::string>::failure(response.network_error_message,
                                                common::ErrorCode::Unavailable);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string message = common::json_get_string(response.body, "message");
    if (message.empty()) {
      message = "HTTP " + std::to_string(response.status);
    }
    return common::Result<std::string>::failure("embedding API error: " + message,
                                                common::ErrorCode::Unavailable);
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  const auto body = post("\"" + common::json_escape(std::string(text)) + "\"");
  if (!body.ok()) {
    return EmbeddingResult::failure_from(body);
  }

  auto parsed = parse_embeddings(body.value(), options_.dimensions);
  if (!parsed.ok()) {
    return EmbeddingResult::failure_from(parsed);
  }
  return EmbeddingResult::success(std::move(parsed.value().front()));
}

common::Result<std::vector<std::vector<float>>>
OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return BatchResult::success({});
  }

  std::string input = "[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      input += ",";
    }
    input += "\"" + common::json_escape(texts[i]) + "\"";
  }
  input += "]";

  const auto body = post(input);
  if (!body.ok()) {
    return BatchResult::failure_from(body);
  }
  auto parsed = parse_embeddings(body.value(), options_.dimensions);
  if (parsed.ok() && parsed.value().size() != texts.size()) {
    return BatchResult::failure("embedding count mismatch", common::ErrorCode::Unavailable);
  }
  return parsed;
}

std::size_t OpenAiEmbedder::dimensions() const { return options_.dimensions; }

} // namespace engram::memory
