#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram::config {

struct StorageConfig {
  std::string ledger_path = "~/.engram/ledger.db";
  // Empty means the embedding cache shares the ledger database file.
  std::string embedding_cache_path;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::size_t dimensions = 384;
  std::optional<std::string> api_key;
  std::string base_url = "https://api.openai.com";
  std::uint64_t timeout_ms = 5'000;
  bool cache_enabled = true;
  std::size_t cache_size = 10'000;
};

struct IndexConfig {
  std::string backend = "flat";
  std::size_t max_entries_per_owner = 100'000;
};

struct RetrievalConfig {
  std::size_t default_limit = 10;
  std::size_t candidate_multiplier = 2;
};

struct ContextConfig {
  std::size_t max_memories = 5;
  std::size_t window_turns = 3;
  double min_importance = 0.5;
  std::string header = "RELEVANT MEMORIES:";
};

struct LearnerRule {
  std::string category;
  double importance = 0.0;
  std::vector<std::string> keywords;
  // Only classify a turn when no later rule has a keyword match.
  std::vector<std::string> weak_keywords = {};
};

struct LearnerConfig {
  // Evaluated in order; the first rule with a matching keyword classifies the turn.
  std::vector<LearnerRule> rules = {
      {"preference", 0.8, {"like", "love", "hate", "prefer", "favorite"}},
      {"fact", 0.7, {"is", "are", "was", "were", "has", "have"}, {"am"}},
      {"emotion", 0.9, {"feel", "happy", "sad", "angry", "excited", "worried"}},
  };
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StorageConfig storage;
  EmbeddingConfig embedding;
  IndexConfig index;
  RetrievalConfig retrieval;
  ContextConfig context;
  LearnerConfig learner;
  ObservabilityConfig observability;
};

} // namespace engram::config
