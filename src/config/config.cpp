#include "engram/config/config.hpp"

#include "engram/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace engram::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".engram";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

const std::vector<std::string> &known_categories() {
  static const std::vector<std::string> categories = {"conversation", "preference", "fact",
                                                      "emotion"};
  return categories;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("ENGRAM_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0 ||
      !std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_';
      })) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("ENGRAM_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

void load_learner_rules(Config &config, const common::TomlDocument &doc) {
  std::vector<std::string> default_order;
  for (const auto &rule : config.learner.rules) {
    default_order.push_back(rule.category);
  }
  const auto order = doc.get_string_array("learner.order", default_order);

  std::vector<LearnerRule> rules;
  for (const auto &raw_name : order) {
    const std::string name = common::to_lower(common::trim(raw_name));
    if (name.empty()) {
      continue;
    }
    LearnerRule rule{.category = name, .importance = 0.5, .keywords = {}};
    const auto existing =
        std::find_if(config.learner.rules.begin(), config.learner.rules.end(),
                     [&](const LearnerRule &candidate) { return candidate.category == name; });
    if (existing != config.learner.rules.end()) {
      rule = *existing;
    }

    const std::string prefix = "learner." + name + ".";
    rule.importance = doc.get_double(prefix + "importance", rule.importance);
    rule.keywords = doc.get_string_array(prefix + "keywords", rule.keywords);
    rule.weak_keywords = doc.get_string_array(prefix + "weak_keywords", rule.weak_keywords);
    for (auto &keyword : rule.keywords) {
      keyword = common::to_lower(common::trim(keyword));
    }
    for (auto &keyword : rule.weak_keywords) {
      keyword = common::to_lower(common::trim(keyword));
    }
    rules.push_back(std::move(rule));
  }
  config.learner.rules = std::move(rules);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *ledger = non_empty_env("ENGRAM_LEDGER_PATH")) {
    config.storage.ledger_path = ledger;
  }
  if (const char *provider = non_empty_env("ENGRAM_EMBEDDING_PROVIDER")) {
    config.embedding.provider = provider;
  }
  if (const char *model = non_empty_env("ENGRAM_EMBEDDING_MODEL")) {
    config.embedding.model = model;
  }
  if (const char *backend = non_empty_env("ENGRAM_OBSERVABILITY")) {
    config.observability.backend = backend;
  }

  if (const char *api_key = non_empty_env("ENGRAM_API_KEY")) {
    config.embedding.api_key = std::string(api_key);
    return;
  }
  if (config.embedding.api_key.has_value() && !common::trim(*config.embedding.api_key).empty()) {
    return;
  }
  if (const char *openai_key = non_empty_env("OPENAI_API_KEY")) {
    config.embedding.api_key = std::string(openai_key);
  }
}

common::Result<Config> config_from_toml(const common::TomlDocument &doc) {
  Config config;

  config.storage.ledger_path =
      expand_config_value(doc.get_string("storage.ledger_path", config.storage.ledger_path));
  config.storage.embedding_cache_path = expand_config_value(
      doc.get_string("storage.embedding_cache_path", config.storage.embedding_cache_path));

  auto &embedding = config.embedding;
  embedding.provider = doc.get_string("embedding.provider", embedding.provider);
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.dimensions =
      static_cast<std::size_t>(doc.get_u64("embedding.dimensions", embedding.dimensions));
  if (doc.has("embedding.api_key")) {
    embedding.api_key = expand_config_value(doc.get_string("embedding.api_key"));
  }
  embedding.base_url = doc.get_string("embedding.base_url", embedding.base_url);
  embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", embedding.timeout_ms);
  embedding.cache_enabled = doc.get_bool("embedding.cache_enabled", embedding.cache_enabled);
  embedding.cache_size =
      static_cast<std::size_t>(doc.get_u64("embedding.cache_size", embedding.cache_size));

  config.index.backend = doc.get_string("index.backend", config.index.backend);
  config.index.max_entries_per_owner = static_cast<std::size_t>(
      doc.get_u64("index.max_entries_per_owner", config.index.max_entries_per_owner));

  config.retrieval.default_limit = static_cast<std::size_t>(
      doc.get_u64("retrieval.default_limit", config.retrieval.default_limit));
  config.retrieval.candidate_multiplier = static_cast<std::size_t>(
      doc.get_u64("retrieval.candidate_multiplier", config.retrieval.candidate_multiplier));

  config.context.max_memories =
      static_cast<std::size_t>(doc.get_u64("context.max_memories", config.context.max_memories));
  config.context.window_turns =
      static_cast<std::size_t>(doc.get_u64("context.window_turns", config.context.window_turns));
  config.context.min_importance =
      doc.get_double("context.min_importance", config.context.min_importance);
  config.context.header = doc.get_string("context.header", config.context.header);

  load_learner_rules(config, doc);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

std::string config_to_toml(const Config &config) {
  std::ostringstream out;

  out << "[storage]\n";
  out << "ledger_path = " << common::quote_toml_string(config.storage.ledger_path) << "\n";
  out << "embedding_cache_path = "
      << common::quote_toml_string(config.storage.embedding_cache_path) << "\n";

  out << "\n[embedding]\n";
  out << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  out << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  out << "dimensions = " << config.embedding.dimensions << "\n";
  if (config.embedding.api_key.has_value()) {
    out << "api_key = " << common::quote_toml_string(*config.embedding.api_key) << "\n";
  }
  out << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  out << "timeout_ms = " << config.embedding.timeout_ms << "\n";
  out << "cache_enabled = " << (config.embedding.cache_enabled ? "true" : "false") << "\n";
  out << "cache_size = " << config.embedding.cache_size << "\n";

  out << "\n[index]\n";
  out << "backend = " << common::quote_toml_string(config.index.backend) << "\n";
  out << "max_entries_per_owner = " << config.index.max_entries_per_owner << "\n";

  out << "\n[retrieval]\n";
  out << "default_limit = " << config.retrieval.default_limit << "\n";
  out << "candidate_multiplier = " << config.retrieval.candidate_multiplier << "\n";

  out << "\n[context]\n";
  out << "max_memories = " << config.context.max_memories << "\n";
  out << "window_turns = " << config.context.window_turns << "\n";
  out << "min_importance = " << config.context.min_importance << "\n";
  out << "header = " << common::quote_toml_string(config.context.header) << "\n";

  std::vector<std::string> order;
  for (const auto &rule : config.learner.rules) {
    order.push_back(rule.category);
  }
  out << "\n[learner]\n";
  out << "order = " << common::toml_string_array(order) << "\n";
  for (const auto &rule : config.learner.rules) {
    out << "\n[learner." << rule.category << "]\n";
    out << "importance = " << rule.importance << "\n";
    out << "keywords = " << common::toml_string_array(rule.keywords) << "\n";
    if (!rule.weak_keywords.empty()) {
      out << "weak_keywords = " << common::toml_string_array(rule.weak_keywords) << "\n";
    }
  }

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return out.str();
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure_from(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorCode::Storage);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           common::ErrorCode::Validation);
  }

  auto config = config_from_toml(parsed.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error(), cfg_path_result.code());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message(),
                                   common::ErrorCode::Storage);
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file",
                                 common::ErrorCode::Storage);
  }
  file << config_to_toml(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file",
                                 common::ErrorCode::Storage);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message(),
                                 common::ErrorCode::Storage);
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  const auto invalid = [](const std::string &message) {
    return ValidationResult::failure(message, common::ErrorCode::Validation);
  };
  std::vector<std::string> warnings;

  if (common::trim(config.storage.ledger_path).empty()) {
    return invalid("storage.ledger_path must not be empty");
  }

  const std::string provider = common::to_lower(common::trim(config.embedding.provider));
  if (provider != "local" && provider != "openai" && provider != "noop" && provider != "none") {
    return invalid("Invalid embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.dimensions == 0) {
    return invalid("embedding.dimensions must be greater than 0");
  }
  if (config.embedding.timeout_ms == 0) {
    return invalid("embedding.timeout_ms must be greater than 0");
  }
  if (provider == "openai" &&
      (!config.embedding.api_key.has_value() || common::trim(*config.embedding.api_key).empty())) {
    warnings.push_back("embedding.provider is openai but no api_key is set; the local embedder "
                       "will be used");
  }
  if (config.embedding.cache_enabled && config.embedding.cache_size == 0) {
    warnings.push_back("embedding.cache_size is 0; the embedding cache will hold nothing");
  }

  const std::string index_backend = common::to_lower(common::trim(config.index.backend));
  if (index_backend != "flat" && index_backend != "none") {
    return invalid("Invalid index.backend: " + config.index.backend);
  }
  if (index_backend == "flat" && config.index.max_entries_per_owner == 0) {
    return invalid("index.max_entries_per_owner must be greater than 0");
  }
  if (index_backend == "none" || provider == "noop" || provider == "none") {
    warnings.push_back("semantic ranking is disabled; memories are ordered by importance and "
                       "recency only");
  }

  if (config.retrieval.default_limit == 0) {
    return invalid("retrieval.default_limit must be greater than 0");
  }
  if (config.retrieval.candidate_multiplier == 0) {
    return invalid("retrieval.candidate_multiplier must be at least 1");
  }

  if (config.context.min_importance < 0.0 || config.context.min_importance > 1.0) {
    return invalid("context.min_importance must be between 0.0 and 1.0");
  }
  if (config.context.max_memories == 0) {
    warnings.push_back("context.max_memories is 0; memory context will always be empty");
  }
  if (config.context.window_turns == 0) {
    return invalid("context.window_turns must be greater than 0");
  }

  for (const auto &rule : config.learner.rules) {
    const auto &categories = known_categories();
    if (std::find(categories.begin(), categories.end(), rule.category) == categories.end()) {
      return invalid("Unknown learner category: " + rule.category);
    }
    if (rule.importance < 0.0 || rule.importance > 1.0) {
      return invalid("learner." + rule.category + ".importance must be between 0.0 and 1.0");
    }
    if (rule.keywords.empty() && rule.weak_keywords.empty()) {
      warnings.push_back("learner." + rule.category + " has no keywords and never matches");
    }
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace engram::config
