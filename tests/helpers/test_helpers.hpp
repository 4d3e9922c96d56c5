#pragma once

#include "engram/config/schema.hpp"
#include "engram/memory/embedder.hpp"
#include "engram/memory/types.hpp"
#include "engram/memory/vector_index.hpp"
#include "engram/net/http_client.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace engram::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Local embedder, flat index, ledger inside the workspace, no logging.
config::Config temp_config(const TempWorkspace &workspace);

/// Clock the test advances by hand.
class ManualClock {
public:
  ManualClock();

  [[nodiscard]] memory::Timestamp now() const { return *now_; }
  void advance(std::chrono::microseconds delta) { *now_ += delta; }
  /// Copies share this clock's time.
  [[nodiscard]] memory::Clock as_clock() const;

private:
  std::shared_ptr<memory::Timestamp> now_;
};

class FailingEmbedder final : public memory::IEmbedder {
public:
  explicit FailingEmbedder(std::size_t dimensions = 8) : dimensions_(dimensions) {}

  [[nodiscard]] std::string_view name() const override { return "failing"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  std::size_t calls = 0;

private:
  std::size_t dimensions_;
};

/// Returns vectors from a fixed table; unknown texts map to the zero vector.
class TableEmbedder final : public memory::IEmbedder {
public:
  explicit TableEmbedder(std::size_t dimensions) : dimensions_(dimensions) {}

  void set(const std::string &text, std::vector<float> vector);

  [[nodiscard]] std::string_view name() const override { return "table"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  std::size_t calls = 0;

private:
  std::size_t dimensions_;
  std::vector<std::pair<std::string, std::vector<float>>> table_;
};

/// Index whose every operation fails with Unavailable.
class FailingVectorIndex final : public memory::IVectorIndex {
public:
  [[nodiscard]] std::string_view name() const override { return "failing"; }
  [[nodiscard]] common::Status upsert(const std::string &owner_id, memory::MemoryId id,
                                      const std::vector<float> &embedding,
                                      const memory::ContextMap &metadata) override;
  [[nodiscard]] common::Result<std::vector<memory::VectorHit>>
  query(const std::string &owner_id, const std::vector<float> &embedding,
        std::size_t k) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &owner_id,
                                            memory::MemoryId id) override;
  [[nodiscard]] common::Status drop_owner(const std::string &owner_id) override;
  [[nodiscard]] std::size_t size(const std::string &) const override { return 0; }
  [[nodiscard]] std::size_t total_size() const override { return 0; }
  [[nodiscard]] bool health_check() override { return false; }

  std::size_t remove_calls = 0;
};

/// Replays one canned response and remembers the last request.
class FakeHttpClient final : public net::HttpClient {
public:
  [[nodiscard]] net::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

  net::HttpResponse response;
  std::string last_url;
  std::string last_body;
  std::unordered_map<std::string, std::string> last_headers;
  std::uint64_t last_timeout_ms = 0;
  std::size_t calls = 0;
};

} // namespace engram::testing
