#include "engram/memory/types.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace engram::memory {

std::string category_to_string(const MemoryCategory category) {
  switch (category) {
  case MemoryCategory::Conversation:
    return "conversation";
  case MemoryCategory::Preference:
    return "preference";
  case MemoryCategory::Fact:
    return "fact";
  case MemoryCategory::Emotion:
    return "emotion";
  }
  return "conversation";
}

std::optional<MemoryCategory> parse_category(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "conversation") {
    return MemoryCategory::Conversation;
  }
  if (normalized == "preference") {
    return MemoryCategory::Preference;
  }
  if (normalized == "fact") {
    return MemoryCategory::Fact;
  }
  if (normalized == "emotion") {
    return MemoryCategory::Emotion;
  }
  return std::nullopt;
}

double clamp_importance(const double importance) {
  if (std::isnan(importance)) {
    return 0.0;
  }
  return std::clamp(importance, 0.0, 1.0);
}

bool is_expired(const Memory &memory, const Timestamp now) {
  return memory.expires_at.has_value() && *memory.expires_at <= now;
}

std::int64_t to_epoch_micros(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_micros(const std::int64_t micros) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

std::string to_rfc3339(const Timestamp ts) {
  const std::int64_t micros = to_epoch_micros(ts);
  std::int64_t seconds = micros / 1'000'000;
  std::int64_t fraction = micros % 1'000'000;
  if (fraction < 0) {
    fraction += 1'000'000;
    --seconds;
  }

  const auto raw = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&raw, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (fraction != 0) {
    out << '.' << std::setw(6) << std::setfill('0') << fraction;
  }
  out << 'Z';
  return out.str();
}

std::optional<Timestamp> parse_rfc3339(const std::string &value) {
  const std::string trimmed = common::trim(value);
  std::tm tm{};
  std::istringstream in(trimmed);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::int64_t fraction_micros = 0;
  if (in.peek() == '.') {
    in.get();
    std::string digits;
    while (std::isdigit(in.peek()) != 0) {
      digits.push_back(static_cast<char>(in.get()));
    }
    if (digits.empty()) {
      return std::nullopt;
    }
    digits.resize(6, '0');
    fraction_micros = std::stoll(digits);
  }

  std::string suffix;
  std::getline(in, suffix);
  if (suffix != "Z" && suffix != "z" && suffix != "+00:00") {
    return std::nullopt;
  }

  const std::time_t seconds = timegm(&tm);
  return from_epoch_micros(static_cast<std::int64_t>(seconds) * 1'000'000 + fraction_micros);
}

Timestamp system_now() { return std::chrono::system_clock::now(); }

std::string memory_to_json(const Memory &memory) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << memory.id << ",";
  out << "\"owner_id\":\"" << common::json_escape(memory.owner_id) << "\",";
  out << "\"category\":\"" << category_to_string(memory.category) << "\",";
  out << "\"content\":\"" << common::json_escape(memory.content) << "\",";
  out << "\"context\":" << common::json_write_flat(memory.context) << ",";
  out << "\"importance\":" << memory.importance << ",";
  out << "\"created_at\":\"" << to_rfc3339(memory.created_at) << "\",";
  out << "\"last_accessed_at\":\"" << to_rfc3339(memory.last_accessed_at) << "\",";
  if (memory.expires_at.has_value()) {
    out << "\"expires_at\":\"" << to_rfc3339(*memory.expires_at) << "\"";
  } else {
    out << "\"expires_at\":null";
  }
  out << "}";
  return out.str();
}

} // namespace engram::memory
