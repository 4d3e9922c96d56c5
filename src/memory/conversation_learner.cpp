#include "engram/memory/conversation_learner.hpp"

#include "engram/common/fs.hpp"
#include "engram/observability/global.hpp"

#include <algorithm>

namespace engram::memory {

namespace {

// Shorter keywords ("is", "am") must equal a word; longer ones also match
// inflections ("liked", "feeling").
constexpr std::size_t kMinPrefixKeyword = 4;

std::vector<std::string> normalize_keywords(const std::vector<std::string> &raw) {
  std::vector<std::string> keywords;
  for (const auto &keyword : raw) {
    const std::string normalized = common::to_lower(common::trim(keyword));
    if (!normalized.empty()) {
      keywords.push_back(normalized);
    }
  }
  return keywords;
}

bool word_matches(const std::string &word, const std::string &keyword) {
  if (keyword.size() < kMinPrefixKeyword) {
    return word == keyword;
  }
  return word.starts_with(keyword);
}

const std::string *find_keyword(const std::vector<std::string> &keywords,
                                const std::vector<std::string> &words) {
  for (const auto &word : words) {
    const auto hit = std::find_if(keywords.begin(), keywords.end(),
                                  [&](const std::string &keyword) {
                                    return word_matches(word, keyword);
                                  });
    if (hit != keywords.end()) {
      return &*hit;
    }
  }
  return nullptr;
}

} // namespace

ConversationLearner::ConversationLearner(IMemoryWriter &writer, config::LearnerConfig config)
    : writer_(writer) {
  for (auto &rule : config.rules) {
    const auto category = parse_category(rule.category);
    if (!category.has_value()) {
      observability::record_error("learner", "ignoring rule with unknown category " +
                                                 rule.category);
      continue;
    }
    rules_.push_back(Rule{.category = *category,
                          .importance = clamp_importance(rule.importance),
                          .keywords = normalize_keywords(rule.keywords),
                          .weak_keywords = normalize_keywords(rule.weak_keywords)});
  }
}

std::optional<Classification> ConversationLearner::classify(const std::string &text) const {
  const auto words = common::split_words(text);
  if (words.empty()) {
    return std::nullopt;
  }

  std::optional<Classification> weak_match;
  for (const auto &rule : rules_) {
    if (const auto *hit = find_keyword(rule.keywords, words); hit != nullptr) {
      return Classification{
          .category = rule.category, .importance = rule.importance, .keyword = *hit};
    }
    if (weak_match.has_value()) {
      continue;
    }
    if (const auto *hit = find_keyword(rule.weak_keywords, words); hit != nullptr) {
      weak_match = Classification{
          .category = rule.category, .importance = rule.importance, .keyword = *hit};
    }
  }
  return weak_match;
}

common::Result<std::vector<ChatTurn>>
ConversationLearner::learn(const PersonaMemoryConfig &persona, const std::string &owner_id,
                           const std::vector<ChatTurn> &turns) {
  using LearnResult = common::Result<std::vector<ChatTurn>>;
  std::vector<ChatTurn> learned;
  if (!persona.memory_enabled || !persona.learning_enabled || turns.empty()) {
    return LearnResult::success(std::move(learned));
  }

  std::size_t scanned = 0;
  for (const auto &turn : turns) {
    if (common::to_lower(common::trim(turn.role)) != "user") {
      continue;
    }
    ++scanned;
    const auto classification = classify(turn.content);
    if (!classification.has_value()) {
      continue;
    }

    auto stored = writer_.store_memory(
        persona, NewMemory{.owner_id = owner_id,
                           .category = classification->category,
                           .content = turn.content,
                           .context = {{"source", "conversation"},
                                       {"keyword", classification->keyword}},
                           .importance = classification->importance,
                           .expires_at = std::nullopt});
    if (!stored.ok()) {
      if (stored.code() == common::ErrorCode::Validation) {
        return LearnResult::failure_from(stored);
      }
      observability::record_error("learner", "failed to store turn: " + stored.error());
      continue;
    }
    learned.push_back(turn);
  }

  observability::record_learn(owner_id, scanned, learned.size());
  return LearnResult::success(std::move(learned));
}

} // namespace engram::memory
