#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace engram::memory {

using Timestamp = std::chrono::system_clock::time_point;
using Clock = std::function<Timestamp()>;
using MemoryId = std::int64_t;
using ContextMap = std::map<std::string, std::string>;

enum class MemoryCategory {
  Conversation,
  Preference,
  Fact,
  Emotion,
};

[[nodiscard]] std::string category_to_string(MemoryCategory category);
[[nodiscard]] std::optional<MemoryCategory> parse_category(std::string_view value);

struct Memory {
  MemoryId id = 0;
  std::string owner_id;
  MemoryCategory category = MemoryCategory::Conversation;
  std::string content;
  ContextMap context;
  double importance = 1.0;
  Timestamp created_at;
  Timestamp last_accessed_at;
  std::optional<Timestamp> expires_at;
};

/// A store request; the ledger assigns id and timestamps.
struct NewMemory {
  std::string owner_id;
  MemoryCategory category = MemoryCategory::Conversation;
  std::string content;
  ContextMap context;
  double importance = 1.0;
  std::optional<Timestamp> expires_at;
};

struct PersonaMemoryConfig {
  bool memory_enabled = true;
  bool learning_enabled = true;
};

struct ChatTurn {
  std::string role;
  std::string content;
};

struct MemoryQuery {
  std::string owner_id;
  std::string text;
  std::vector<MemoryCategory> categories;
  std::size_t limit = 10;
  double min_importance = 0.0;
};

[[nodiscard]] double clamp_importance(double importance);
[[nodiscard]] bool is_expired(const Memory &memory, Timestamp now);

[[nodiscard]] std::int64_t to_epoch_micros(Timestamp ts);
[[nodiscard]] Timestamp from_epoch_micros(std::int64_t micros);
[[nodiscard]] std::string to_rfc3339(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parse_rfc3339(const std::string &value);

[[nodiscard]] Timestamp system_now();

[[nodiscard]] std::string memory_to_json(const Memory &memory);

} // namespace engram::memory
