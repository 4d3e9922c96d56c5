#include "engram/cli/commands.hpp"

#include "engram/common/fs.hpp"
#include "engram/common/json_util.hpp"
#include "engram/config/config.hpp"
#include "engram/memory/engine.hpp"
#include "engram/runtime/app.hpp"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace engram::cli {

std::string version_string() {
#ifdef ENGRAM_VERSION
  std::string version = ENGRAM_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef ENGRAM_GIT_COMMIT
  const std::string commit = ENGRAM_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "engram " + version;
}

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated(std::vector<std::string> &args,
                                       const std::string &long_name,
                                       const std::string &short_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, short_name, value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty() || value[0] == '-') {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  const unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(parsed);
}

std::optional<std::int64_t> parse_i64(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  const long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(parsed);
}

std::optional<double> parse_double(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<bool> parse_bool(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

/// Persona gates shared by every memory command.
memory::PersonaMemoryConfig take_persona(std::vector<std::string> &args) {
  memory::PersonaMemoryConfig persona;
  persona.memory_enabled = !take_flag(args, "--memory-disabled");
  persona.learning_enabled = !take_flag(args, "--learning-disabled");
  return persona;
}

/// Parses "role: text" lines; a line without a role prefix is a user turn.
std::vector<memory::ChatTurn> parse_turns(const std::string &input) {
  std::vector<memory::ChatTurn> turns;
  std::istringstream lines(input);
  std::string line;
  while (std::getline(lines, line)) {
    const std::string trimmed = common::trim(line);
    if (trimmed.empty()) {
      continue;
    }
    const auto colon = trimmed.find(':');
    if (colon != std::string::npos) {
      const std::string role = common::to_lower(common::trim(trimmed.substr(0, colon)));
      if (role == "user" || role == "assistant" || role == "system") {
        turns.push_back({.role = role, .content = common::trim(trimmed.substr(colon + 1))});
        continue;
      }
    }
    turns.push_back({.role = "user", .content = trimmed});
  }
  return turns;
}

common::Result<std::unique_ptr<memory::MemoryEngine>> open_engine() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return common::Result<std::unique_ptr<memory::MemoryEngine>>::failure_from(context);
  }
  return context.value().create_memory_engine();
}

void print_memory(const memory::Memory &memory) {
  std::cout << "#" << memory.id << " [" << memory::category_to_string(memory.category)
            << ", importance " << memory.importance << "] " << memory.content << "\n";
  if (memory.expires_at.has_value()) {
    std::cout << "    expires " << memory::to_rfc3339(*memory.expires_at) << "\n";
  }
}

void print_memories(const std::vector<memory::Memory> &memories, const bool json) {
  if (json) {
    std::cout << "[";
    for (std::size_t i = 0; i < memories.size(); ++i) {
      if (i > 0) {
        std::cout << ",";
      }
      std::cout << memory::memory_to_json(memories[i]);
    }
    std::cout << "]\n";
    return;
  }
  if (memories.empty()) {
    std::cout << "No memories found.\n";
    return;
  }
  for (const auto &memory : memories) {
    print_memory(memory);
  }
}

int run_store(std::vector<std::string> args) {
  const auto persona = take_persona(args);
  const bool json = take_flag(args, "--json");

  memory::NewMemory request;
  std::string value;
  if (!take_option(args, "--owner", "-o", request.owner_id)) {
    std::cerr << "usage: engram store --owner ID [--category C] [--importance F] "
                 "[--context K=V] [--expires-at TIME | --ttl SECONDS] <content>\n";
    return 1;
  }
  if (take_option(args, "--category", "-c", value)) {
    const auto category = memory::parse_category(value);
    if (!category.has_value()) {
      std::cerr << "unknown category: " << value << "\n";
      return 1;
    }
    request.category = *category;
  }
  if (take_option(args, "--importance", "-i", value)) {
    const auto importance = parse_double(value);
    if (!importance.has_value()) {
      std::cerr << "invalid importance: " << value << "\n";
      return 1;
    }
    request.importance = *importance;
  }
  for (const auto &pair : take_repeated(args, "--context", "")) {
    const auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "context entries must look like key=value: " << pair << "\n";
      return 1;
    }
    request.context[pair.substr(0, eq)] = pair.substr(eq + 1);
  }
  if (take_option(args, "--expires-at", "", value)) {
    const auto expires = memory::parse_rfc3339(value);
    if (!expires.has_value()) {
      std::cerr << "invalid --expires-at timestamp: " << value << "\n";
      return 1;
    }
    request.expires_at = *expires;
  } else if (take_option(args, "--ttl", "", value)) {
    const auto seconds = parse_u64(value);
    if (!seconds.has_value()) {
      std::cerr << "invalid --ttl: " << value << "\n";
      return 1;
    }
    request.expires_at =
        memory::system_now() + std::chrono::seconds(static_cast<std::int64_t>(*seconds));
  }
  request.content = join_tokens(args);
  if (common::trim(request.content).empty()) {
    request.content = read_stdin_all();
  }

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto stored = engine.value()->store_memory(persona, request);
  if (!stored.ok()) {
    std::cerr << stored.error() << "\n";
    return 1;
  }
  if (json) {
    std::cout << memory::memory_to_json(stored.value()) << "\n";
  } else {
    std::cout << "Stored memory #" << stored.value().id << "\n";
  }
  return 0;
}

int run_recall(std::vector<std::string> args) {
  const auto persona = take_persona(args);
  const bool json = take_flag(args, "--json");

  memory::MemoryQuery query;
  query.limit = 0;
  std::string value;
  if (!take_option(args, "--owner", "-o", query.owner_id)) {
    std::cerr << "usage: engram recall --owner ID [--limit N] [--category C] "
                 "[--min-importance F] [query]\n";
    return 1;
  }
  if (take_option(args, "--limit", "-n", value)) {
    const auto limit = parse_u64(value);
    if (!limit.has_value()) {
      std::cerr << "invalid --limit: " << value << "\n";
      return 1;
    }
    query.limit = static_cast<std::size_t>(*limit);
    if (query.limit == 0) {
      print_memories({}, json);
      return 0;
    }
  }
  for (const auto &raw : take_repeated(args, "--category", "-c")) {
    const auto category = memory::parse_category(raw);
    if (!category.has_value()) {
      std::cerr << "unknown category: " << raw << "\n";
      return 1;
    }
    query.categories.push_back(*category);
  }
  if (take_option(args, "--min-importance", "", value)) {
    const auto min_importance = parse_double(value);
    if (!min_importance.has_value()) {
      std::cerr << "invalid --min-importance: " << value << "\n";
      return 1;
    }
    query.min_importance = *min_importance;
  }
  query.text = join_tokens(args);

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto memories = engine.value()->retrieve_memories(persona, query);
  if (!memories.ok()) {
    std::cerr << memories.error() << "\n";
    return 1;
  }
  print_memories(memories.value(), json);
  return 0;
}

int run_get(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  if (args.empty()) {
    std::cerr << "usage: engram get <id> [--json]\n";
    return 1;
  }
  const auto id = parse_i64(args[0]);
  if (!id.has_value()) {
    std::cerr << "invalid memory id: " << args[0] << "\n";
    return 1;
  }

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto found = engine.value()->get_memory(*id);
  if (!found.ok()) {
    std::cerr << found.error() << "\n";
    return 1;
  }
  if (json) {
    std::cout << memory::memory_to_json(found.value()) << "\n";
  } else {
    print_memory(found.value());
  }
  return 0;
}

int run_forget(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: engram forget <id>\n";
    return 1;
  }
  const auto id = parse_i64(args[0]);
  if (!id.has_value()) {
    std::cerr << "invalid memory id: " << args[0] << "\n";
    return 1;
  }

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto status = engine.value()->delete_memory(*id);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "Forgot memory #" << *id << "\n";
  return 0;
}

int run_learn(std::vector<std::string> args) {
  const auto persona = take_persona(args);
  const bool json = take_flag(args, "--json");
  std::string owner;
  if (!take_option(args, "--owner", "-o", owner)) {
    std::cerr << "usage: engram learn --owner ID < conversation.txt\n";
    return 1;
  }
  const auto turns = parse_turns(read_stdin_all());

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto learned = engine.value()->learn_from_conversation(persona, owner, turns);
  if (!learned.ok()) {
    std::cerr << learned.error() << "\n";
    return 1;
  }
  if (json) {
    std::cout << "{\"learned\":" << learned.value().size() << "}\n";
    return 0;
  }
  std::cout << "Learned " << learned.value().size() << " of " << turns.size() << " turns\n";
  for (const auto &turn : learned.value()) {
    std::cout << "  - " << turn.content << "\n";
  }
  return 0;
}

int run_context(std::vector<std::string> args) {
  const auto persona = take_persona(args);
  std::string owner;
  std::string value;
  if (!take_option(args, "--owner", "-o", owner)) {
    std::cerr << "usage: engram context --owner ID [--max N] < history.txt\n";
    return 1;
  }
  std::size_t max_memories = 0;
  if (take_option(args, "--max", "-n", value)) {
    const auto parsed = parse_u64(value);
    if (!parsed.has_value()) {
      std::cerr << "invalid --max: " << value << "\n";
      return 1;
    }
    max_memories = static_cast<std::size_t>(*parsed);
  }

  std::vector<memory::ChatTurn> history;
  if (!args.empty()) {
    history.push_back({.role = "user", .content = join_tokens(args)});
  } else {
    history = parse_turns(read_stdin_all());
  }

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  std::cout << engine.value()->memory_context(persona, owner, history, max_memories);
  return 0;
}

int run_sweep() {
  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto report = engine.value()->purge_expired(memory::system_now());
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }
  std::cout << "Purged " << report.value().purged << " expired memories";
  if (report.value().index_failures > 0) {
    std::cout << " (" << report.value().index_failures << " index removals failed)";
  }
  std::cout << "\n";
  return 0;
}

int run_reindex(std::vector<std::string> args) {
  std::string owner;
  std::optional<std::string> scope;
  if (take_option(args, "--owner", "-o", owner)) {
    scope = owner;
  }

  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  auto report = engine.value()->rebuild_index(scope);
  if (!report.ok()) {
    std::cerr << report.error() << "\n";
    return 1;
  }
  std::cout << "Indexed " << report.value().entries << " memories for "
            << report.value().owners << " owners";
  if (report.value().failures > 0) {
    std::cout << " (" << report.value().failures << " owners failed)";
  }
  std::cout << "\n";
  return report.value().failures == 0 ? 0 : 1;
}

int run_status(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  auto engine = open_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  const auto status = engine.value()->status();
  auto cp = config::config_path();

  if (json) {
    std::ostringstream out;
    out << "{\"ledger\":{\"backend\":\"" << common::json_escape(status.ledger_backend)
        << "\",\"healthy\":" << (status.ledger_healthy ? "true" : "false")
        << ",\"memories\":" << status.memory_count << "},"
        << "\"embedder\":{\"provider\":\"" << common::json_escape(status.embedder)
        << "\",\"available\":" << (status.embedder_available ? "true" : "false")
        << ",\"dimensions\":" << status.embedding_dimensions << "},"
        << "\"index\":{\"backend\":\"" << common::json_escape(status.index_backend)
        << "\",\"entries\":" << status.index_entries << "}";
    if (status.cache.has_value()) {
      out << ",\"cache\":{\"entries\":" << status.cache->entries
          << ",\"hits\":" << status.cache->hits << ",\"misses\":" << status.cache->misses << "}";
    }
    out << "}";
    std::cout << out.str() << "\n";
    return status.ledger_healthy ? 0 : 1;
  }

  std::cout << "Ledger: " << status.ledger_backend
            << (status.ledger_healthy ? " (healthy)" : " (unhealthy)") << ", "
            << status.memory_count << " memories\n";
  std::cout << "Embedder: " << status.embedder
            << (status.embedder_available ? "" : " (unavailable)") << ", "
            << status.embedding_dimensions << " dimensions\n";
  std::cout << "Index: " << status.index_backend << ", " << status.index_entries
            << " entries\n";
  if (status.cache.has_value()) {
    std::cout << "Embedding cache: " << status.cache->entries << " entries\n";
  }
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  return status.ledger_healthy ? 0 : 1;
}

struct ConfigKey {
  std::string name;
  std::function<std::string(const config::Config &)> get;
  std::function<bool(config::Config &, const std::string &)> set;
};

template <typename T>
bool assign(const std::optional<T> &parsed, T &field) {
  if (!parsed.has_value()) {
    return false;
  }
  field = *parsed;
  return true;
}

bool assign_size(const std::string &value, std::size_t &field) {
  const auto parsed = parse_u64(value);
  if (!parsed.has_value()) {
    return false;
  }
  field = static_cast<std::size_t>(*parsed);
  return true;
}

std::string format_double(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

const std::vector<ConfigKey> &config_keys() {
  static const std::vector<ConfigKey> keys = {
      {"storage.ledger_path", [](const auto &c) { return c.storage.ledger_path; },
       [](auto &c, const auto &v) {
         c.storage.ledger_path = v;
         return true;
       }},
      {"storage.embedding_cache_path",
       [](const auto &c) { return c.storage.embedding_cache_path; },
       [](auto &c, const auto &v) {
         c.storage.embedding_cache_path = v;
         return true;
       }},
      {"embedding.provider", [](const auto &c) { return c.embedding.provider; },
       [](auto &c, const auto &v) {
         c.embedding.provider = v;
         return true;
       }},
      {"embedding.model", [](const auto &c) { return c.embedding.model; },
       [](auto &c, const auto &v) {
         c.embedding.model = v;
         return true;
       }},
      {"embedding.dimensions",
       [](const auto &c) { return std::to_string(c.embedding.dimensions); },
       [](auto &c, const auto &v) { return assign_size(v, c.embedding.dimensions); }},
      {"embedding.base_url", [](const auto &c) { return c.embedding.base_url; },
       [](auto &c, const auto &v) {
         c.embedding.base_url = v;
         return true;
       }},
      {"embedding.timeout_ms",
       [](const auto &c) { return std::to_string(c.embedding.timeout_ms); },
       [](auto &c, const auto &v) { return assign(parse_u64(v), c.embedding.timeout_ms); }},
      {"embedding.cache_enabled",
       [](const auto &c) { return std::string(c.embedding.cache_enabled ? "true" : "false"); },
       [](auto &c, const auto &v) { return assign(parse_bool(v), c.embedding.cache_enabled); }},
      {"embedding.cache_size",
       [](const auto &c) { return std::to_string(c.embedding.cache_size); },
       [](auto &c, const auto &v) { return assign_size(v, c.embedding.cache_size); }},
      {"index.backend", [](const auto &c) { return c.index.backend; },
       [](auto &c, const auto &v) {
         c.index.backend = v;
         return true;
       }},
      {"index.max_entries_per_owner",
       [](const auto &c) { return std::to_string(c.index.max_entries_per_owner); },
       [](auto &c, const auto &v) { return assign_size(v, c.index.max_entries_per_owner); }},
      {"retrieval.default_limit",
       [](const auto &c) { return std::to_string(c.retrieval.default_limit); },
       [](auto &c, const auto &v) { return assign_size(v, c.retrieval.default_limit); }},
      {"retrieval.candidate_multiplier",
       [](const auto &c) { return std::to_string(c.retrieval.candidate_multiplier); },
       [](auto &c, const auto &v) { return assign_size(v, c.retrieval.candidate_multiplier); }},
      {"context.max_memories",
       [](const auto &c) { return std::to_string(c.context.max_memories); },
       [](auto &c, const auto &v) { return assign_size(v, c.context.max_memories); }},
      {"context.window_turns",
       [](const auto &c) { return std::to_string(c.context.window_turns); },
       [](auto &c, const auto &v) { return assign_size(v, c.context.window_turns); }},
      {"context.min_importance",
       [](const auto &c) { return format_double(c.context.min_importance); },
       [](auto &c, const auto &v) { return assign(parse_double(v), c.context.min_importance); }},
      {"context.header", [](const auto &c) { return c.context.header; },
       [](auto &c, const auto &v) {
         c.context.header = v;
         return true;
       }},
      {"observability.backend", [](const auto &c) { return c.observability.backend; },
       [](auto &c, const auto &v) {
         c.observability.backend = v;
         return true;
       }},
  };
  return keys;
}

const ConfigKey *find_config_key(const std::string &name) {
  for (const auto &key : config_keys()) {
    if (key.name == name) {
      return &key;
    }
  }
  return nullptr;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::config_to_toml(cfg.value());
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: engram config get <key>\n";
      return 1;
    }
    const auto *key = find_config_key(args[1]);
    if (key == nullptr) {
      std::cerr << "unknown key: " << args[1] << "\n";
      return 1;
    }
    std::cout << key->get(cfg.value()) << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: engram config set <key> <value>\n";
      return 1;
    }
    const auto *key = find_config_key(args[1]);
    if (key == nullptr) {
      std::cerr << "unknown key: " << args[1] << "\n";
      return 1;
    }
    const std::string value = join_tokens(args, 2);
    if (!key->set(cfg.value(), value)) {
      std::cerr << "invalid value for " << key->name << ": " << value << "\n";
      return 1;
    }
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cerr << "warning: " << warning << "\n";
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";
  constexpr const char *YELLOW = "\033[33m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  engram" << RESET << DIM
            << " - long-term memory for persona chat" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "engram [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  MEMORIES" << RESET << "\n";
  std::cout << "  " << GREEN << "store" << RESET << DIM << "          Store a memory for an owner" << RESET << "\n";
  std::cout << "  " << GREEN << "recall" << RESET << DIM << "         Retrieve the most relevant memories" << RESET << "\n";
  std::cout << "  " << GREEN << "get" << RESET << " ID" << DIM << "         Show one memory" << RESET << "\n";
  std::cout << "  " << GREEN << "forget" << RESET << " ID" << DIM << "      Delete one memory" << RESET << "\n";
  std::cout << "  " << GREEN << "learn" << RESET << DIM << "          Learn memories from 'role: text' lines on stdin" << RESET << "\n";
  std::cout << "  " << GREEN << "context" << RESET << DIM << "        Print the memory block for a conversation" << RESET << "\n\n";

  std::cout << BOLD << "  MAINTENANCE" << RESET << "\n";
  std::cout << "  " << GREEN << "sweep" << RESET << DIM << "          Purge expired memories" << RESET << "\n";
  std::cout << "  " << GREEN << "reindex" << RESET << DIM << "        Rebuild the vector index from the ledger" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "         Show backend health" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "    Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config get" << RESET << " KEY" << DIM << " Print one setting" << RESET << "\n";
  std::cout << "  " << GREEN << "config set" << RESET << " KEY VALUE" << DIM << "  Change one setting" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET << "\n\n";

  std::cout << BOLD << "  COMMON OPTIONS" << RESET << "\n";
  std::cout << "  " << YELLOW << "--owner ID" << RESET << "  " << YELLOW << "--json" << RESET
            << "  " << YELLOW << "--memory-disabled" << RESET << "  " << YELLOW
            << "--learning-disabled" << RESET << "\n";
  std::cout << "\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "store") {
    return run_store(std::move(args));
  }
  if (subcommand == "recall") {
    return run_recall(std::move(args));
  }
  if (subcommand == "get") {
    return run_get(std::move(args));
  }
  if (subcommand == "forget") {
    return run_forget(std::move(args));
  }
  if (subcommand == "learn") {
    return run_learn(std::move(args));
  }
  if (subcommand == "context") {
    return run_context(std::move(args));
  }
  if (subcommand == "sweep") {
    return run_sweep();
  }
  if (subcommand == "reindex") {
    return run_reindex(std::move(args));
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace engram::cli
