#include "test_framework.hpp"

#include "engram/memory/embedder.hpp"
#include "engram/memory/embedder_local.hpp"
#include "engram/memory/embedder_noop.hpp"
#include "engram/memory/embedder_openai.hpp"
#include "engram/memory/embedding_cache.hpp"
#include "engram/memory/vector_index.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

std::string embedding_response(const std::vector<std::vector<float>> &vectors) {
  std::string body = "{\"object\":\"list\",\"data\":[";
  for (std::size_t i = 0; i < vectors.size(); ++i) {
    if (i > 0) {
      body += ",";
    }
    body += "{\"object\": \"embedding\", \"index\": " + std::to_string(i) + ", \"embedding\": [";
    for (std::size_t j = 0; j < vectors[i].size(); ++j) {
      if (j > 0) {
        body += ", ";
      }
      body += std::to_string(vectors[i][j]);
    }
    body += "]}";
  }
  body += "],\"model\":\"text-embedding-3-small\"}";
  return body;
}

} // namespace

void register_embedder_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  namespace mem = engram::memory;
  namespace common = engram::common;
  using engram::testing::FakeHttpClient;
  using engram::testing::TableEmbedder;
  using engram::testing::TempWorkspace;

  tests.push_back({"local_embedder_is_deterministic_and_normalised", [] {
                     mem::LocalEmbedder embedder(64);
                     const auto first = embedder.embed("I love hiking on weekends");
                     const auto second = embedder.embed("I love hiking on weekends");
                     require(first.ok() && second.ok(), "local embedding should succeed");
                     require(first.value().size() == 64, "dimension mismatch");
                     require(first.value() == second.value(), "same text, same vector");

                     double norm = 0.0;
                     for (float v : first.value()) {
                       norm += static_cast<double>(v) * static_cast<double>(v);
                     }
                     require(std::fabs(std::sqrt(norm) - 1.0) < 1e-4, "vector should be unit length");
                   }});

  tests.push_back({"local_embedder_prefers_shared_words", [] {
                     mem::LocalEmbedder embedder(256);
                     const auto query = embedder.embed("hiking trails");
                     const auto near = embedder.embed("I love hiking on mountain trails");
                     const auto far = embedder.embed("my cat is orange");
                     require(query.ok() && near.ok() && far.ok(), "embeddings should succeed");
                     require(mem::cosine_similarity(query.value(), near.value()) >
                                 mem::cosine_similarity(query.value(), far.value()),
                             "overlapping text should be closer");
                   }});

  tests.push_back({"local_embedder_batch_matches_single", [] {
                     mem::LocalEmbedder embedder(32);
                     const auto batch = embedder.embed_batch({"alpha", "beta"});
                     require(batch.ok(), batch.error());
                     require(batch.value().size() == 2, "one vector per text");
                     require(batch.value()[1] == embedder.embed("beta").value(),
                             "batch and single embeddings agree");
                   }});

  tests.push_back({"noop_embedder_is_unavailable", [] {
                     mem::NoopEmbedder embedder(16);
                     const auto result = embedder.embed("anything");
                     require(!result.ok(), "noop embedder must fail");
                     require(result.code() == common::ErrorCode::Unavailable,
                             "noop failure is Unavailable");
                   }});

  tests.push_back({"openai_embedder_parses_response", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->response.status = 200;
                     http->response.body = embedding_response({{0.25F, -0.5F, 0.75F, 1.0F}});
                     mem::OpenAiEmbedder embedder(
                         mem::OpenAiEmbedderOptions{.api_key = "sk-test",
                                                    .model = "text-embedding-3-small",
                                                    .dimensions = 4,
                                                    .base_url = "https://example.test/",
                                                    .timeout_ms = 1234},
                         http);

                     const auto result = embedder.embed("hello \"world\"");
                     require(result.ok(), result.error());
                     require(result.value().size() == 4, "dimension mismatch");
                     require(std::fabs(result.value()[1] + 0.5F) < 1e-6F, "value mismatch");
                     require(http->last_url == "https://example.test/v1/embeddings",
                             "trailing slash should be trimmed: " + http->last_url);
                     require(http->last_timeout_ms == 1234, "timeout must reach the transport");
                     require(http->last_headers.at("Authorization") == "Bearer sk-test",
                             "bearer header missing");
                     require(http->last_body.find("\"dimensions\":4") != std::string::npos,
                             "v3 models send dimensions");
                     require(http->last_body.find("hello \\\"world\\\"") != std::string::npos,
                             "input should be JSON escaped");
                   }});

  tests.push_back({"openai_embedder_batch_keeps_order", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->response.status = 200;
                     http->response.body = embedding_response({{1.0F, 0.0F}, {0.0F, 1.0F}});
                     mem::OpenAiEmbedder embedder(
                         mem::OpenAiEmbedderOptions{.api_key = "sk-test", .dimensions = 2}, http);
                     const auto batch = embedder.embed_batch({"first", "second"});
                     require(batch.ok(), batch.error());
                     require(batch.value().size() == 2, "two vectors expected");
                     require(batch.value()[1][1] == 1.0F, "order should follow the response");

                     const auto mismatch = embedder.embed_batch({"one", "two", "three"});
                     require(!mismatch.ok(), "count mismatch should fail");
                   }});

  tests.push_back({"openai_embedder_timeout_is_unavailable", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->response.timeout = true;
                     mem::OpenAiEmbedder embedder(
                         mem::OpenAiEmbedderOptions{.api_key = "sk-test", .timeout_ms = 50}, http);
                     const auto result = embedder.embed("slow");
                     require(!result.ok(), "timeout must fail");
                     require(result.code() == common::ErrorCode::Unavailable,
                             "timeout is Unavailable");
                     require(result.error().find("50ms") != std::string::npos,
                             "message should name the timeout");
                   }});

  tests.push_back({"openai_embedder_http_error_is_unavailable", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     http->response.status = 429;
                     http->response.body = R"({"error":{"message":"Rate limit reached"}})";
                     mem::OpenAiEmbedder embedder(mem::OpenAiEmbedderOptions{.api_key = "sk-test"},
                                                  http);
                     const auto result = embedder.embed("busy");
                     require(!result.ok(), "HTTP error must fail");
                     require(result.code() == common::ErrorCode::Unavailable,
                             "HTTP error is Unavailable");
                     require(result.error().find("Rate limit reached") != std::string::npos,
                             "API message should be surfaced");
                   }});

  tests.push_back({"openai_embedder_without_key_skips_network", [] {
                     auto http = std::make_shared<FakeHttpClient>();
                     mem::OpenAiEmbedder embedder(mem::OpenAiEmbedderOptions{.api_key = " "}, http);
                     const auto result = embedder.embed("text");
                     require(!result.ok(), "missing key must fail");
                     require(http->calls == 0, "no request without a key");
                   }});

  tests.push_back({"create_embedder_selects_provider", [] {
                     engram::config::Config config;
                     config.embedding.dimensions = 48;
                     auto local = mem::create_embedder(config);
                     require(local->name() == "local" && local->dimensions() == 48,
                             "local provider by default");

                     config.embedding.provider = "openai";
                     config.embedding.api_key.reset();
                     require(mem::create_embedder(config)->name() == "local",
                             "openai without a key falls back to local");
                     require(mem::embedding_space_key(config) == "local:48",
                             "space key follows the effective provider");

                     config.embedding.api_key = "sk-test";
                     require(mem::create_embedder(config)->name() == "openai", "openai with a key");
                     require(mem::embedding_space_key(config) == "openai:text-embedding-3-small:48",
                             "openai space key names the model");

                     config.embedding.provider = "none";
                     require(mem::create_embedder(config)->name() == "noop", "none is noop");
                   }});

  tests.push_back({"embedding_cache_hits_on_repeat", [] {
                     TempWorkspace workspace;
                     auto table = std::make_unique<TableEmbedder>(3);
                     table->set("hello", {1.0F, 0.0F, 0.0F});
                     auto *table_ptr = table.get();
                     auto cache = mem::CachedEmbedder::open(workspace.path() / "cache.db",
                                                            std::move(table), "table:3", 100);
                     require(cache.ok(), cache.error());

                     const auto first = cache.value()->embed("hello");
                     const auto second = cache.value()->embed("hello");
                     require(first.ok() && second.ok(), "cached embeds should succeed");
                     require(first.value() == second.value(), "cache must return the same vector");
                     require(table_ptr->calls == 1, "second call should not reach the provider");

                     const auto stats = cache.value()->stats();
                     require(stats.hits == 1 && stats.misses == 1, "hit/miss counters");
                     require(stats.entries == 1, "one cached row");
                   }});

  tests.push_back({"embedding_cache_survives_reopen", [] {
                     TempWorkspace workspace;
                     const auto path = workspace.path() / "cache.db";
                     {
                       auto cache = mem::CachedEmbedder::open(
                           path, std::make_unique<TableEmbedder>(3), "table:3", 100);
                       require(cache.ok(), cache.error());
                       require(cache.value()->embed("persisted").ok(), "embed should succeed");
                     }
                     auto table = std::make_unique<TableEmbedder>(3);
                     auto *table_ptr = table.get();
                     auto reopened = mem::CachedEmbedder::open(path, std::move(table), "table:3", 100);
                     require(reopened.ok(), reopened.error());
                     require(reopened.value()->embed("persisted").ok(), "embed should succeed");
                     require(table_ptr->calls == 0, "persisted entry should be reused");

                     auto other_space = mem::CachedEmbedder::open(
                         path, std::make_unique<TableEmbedder>(3), "other:3", 100);
                     require(other_space.ok(), other_space.error());
                     require(other_space.value()->embed("persisted").ok(), "embed should succeed");
                     require(other_space.value()->stats().misses == 1,
                             "another vector space must not reuse the entry");
                   }});

  tests.push_back({"embedding_cache_evicts_oldest", [] {
                     TempWorkspace workspace;
                     auto cache = mem::CachedEmbedder::open(workspace.path() / "cache.db",
                                                            std::make_unique<TableEmbedder>(2),
                                                            "table:2", 2);
                     require(cache.ok(), cache.error());
                     for (const auto *text : {"one", "two", "three"}) {
                       require(cache.value()->embed(text).ok(), "embed should succeed");
                     }
                     require(cache.value()->stats().entries == 2, "cache should stay bounded");
                   }});

  tests.push_back({"embedding_cache_batch_mixes_hits_and_misses", [] {
                     TempWorkspace workspace;
                     auto table = std::make_unique<TableEmbedder>(2);
                     table->set("a", {1.0F, 0.0F});
                     table->set("b", {0.0F, 1.0F});
                     auto *table_ptr = table.get();
                     auto cache = mem::CachedEmbedder::open(workspace.path() / "cache.db",
                                                            std::move(table), "table:2", 10);
                     require(cache.ok(), cache.error());
                     require(cache.value()->embed("a").ok(), "warm the cache");

                     const auto batch = cache.value()->embed_batch({"a", "b"});
                     require(batch.ok(), batch.error());
                     require(batch.value()[0][0] == 1.0F && batch.value()[1][1] == 1.0F,
                             "batch keeps input order");
                     require(table_ptr->calls == 2, "only the miss reaches the provider");
                   }});
}
