#pragma once

#include "engram/config/schema.hpp"
#include "engram/memory/types.hpp"
#include "engram/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace engram::memory {

/// Where the learner sends the memories it extracts.
class IMemoryWriter {
public:
  virtual ~IMemoryWriter() = default;

  [[nodiscard]] virtual common::Result<Memory> store_memory(const PersonaMemoryConfig &persona,
                                                            const NewMemory &memory) = 0;
};

struct Classification {
  MemoryCategory category = MemoryCategory::Conversation;
  double importance = 0.0;
  std::string keyword;
};

class ConversationLearner {
public:
  ConversationLearner(IMemoryWriter &writer, config::LearnerConfig config);

  /// First rule (in configured order) with a keyword among the text's words.
  /// A rule matched only by a weak keyword is used when no later rule matches.
  [[nodiscard]] std::optional<Classification> classify(const std::string &text) const;

  /// Stores every classifiable user turn and returns those turns. Nothing is
  /// learned when learning or memory is disabled for the persona.
  [[nodiscard]] common::Result<std::vector<ChatTurn>> learn(const PersonaMemoryConfig &persona,
                                                            const std::string &owner_id,
                                                            const std::vector<ChatTurn> &turns);

private:
  struct Rule {
    MemoryCategory category;
    double importance;
    std::vector<std::string> keywords;
    std::vector<std::string> weak_keywords;
  };

  IMemoryWriter &writer_;
  std::vector<Rule> rules_;
};

} // namespace engram::memory
