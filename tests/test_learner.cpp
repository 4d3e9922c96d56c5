#include "test_framework.hpp"

#include "engram/memory/conversation_learner.hpp"

namespace {

namespace mem = engram::memory;
namespace common = engram::common;

class RecordingWriter final : public mem::IMemoryWriter {
public:
  common::Result<mem::Memory> store_memory(const mem::PersonaMemoryConfig &,
                                           const mem::NewMemory &memory) override {
    if (fail_with.has_value()) {
      return common::Result<mem::Memory>::failure("forced", *fail_with);
    }
    stored.push_back(memory);
    mem::Memory out;
    out.id = static_cast<mem::MemoryId>(stored.size());
    out.owner_id = memory.owner_id;
    out.category = memory.category;
    out.content = memory.content;
    out.context = memory.context;
    out.importance = memory.importance;
    return common::Result<mem::Memory>::success(std::move(out));
  }

  std::vector<mem::NewMemory> stored;
  std::optional<common::ErrorCode> fail_with;
};

} // namespace

void register_learner_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;

  tests.push_back({"learner_classifies_default_rules", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});

                     const auto preference = learner.classify("I love hiking on weekends");
                     require(preference.has_value(), "preference expected");
                     require(preference->category == mem::MemoryCategory::Preference &&
                                 preference->importance == 0.8,
                             "preference carries 0.8");
                     require(preference->keyword == "love", "matched keyword reported");

                     const auto fact = learner.classify("I am 28 years old");
                     require(fact.has_value() && fact->category == mem::MemoryCategory::Fact &&
                                 fact->importance == 0.7,
                             "fact carries 0.7");

                     const auto emotion = learner.classify("I feel anxious about the exam");
                     require(emotion.has_value() &&
                                 emotion->category == mem::MemoryCategory::Emotion &&
                                 emotion->importance == 0.9,
                             "emotion carries 0.9");

                     require(!learner.classify("ok").has_value(), "small talk is not learned");
                     require(!learner.classify("").has_value(), "empty text is not learned");
                   }});

  tests.push_back({"learner_matches_whole_words_only", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});
                     require(!learner.classify("Thistle area issues").has_value(),
                             "short keywords inside longer words do not match");
                     require(!learner.classify("Unlike hatred").has_value(),
                             "keywords only match at the start of a word");
                     const auto upper = learner.classify("I LOVE it");
                     require(upper.has_value() &&
                                 upper->category == mem::MemoryCategory::Preference,
                             "matching ignores case");
                   }});

  tests.push_back({"learner_matches_inflected_keywords", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});
                     const auto liked = learner.classify("I really liked that movie");
                     require(liked.has_value() &&
                                 liked->category == mem::MemoryCategory::Preference &&
                                 liked->importance == 0.8,
                             "liked is a preference");
                     require(liked->keyword == "like", "configured keyword reported");

                     for (const std::string text : {"She likes jazz", "I loved Paris",
                                                    "He hated the rain", "Tom prefers tea"}) {
                       const auto result = learner.classify(text);
                       require(result.has_value() &&
                                   result->category == mem::MemoryCategory::Preference,
                               "preference expected for: " + text);
                     }

                     const auto feeling = learner.classify("I'm feeling low tonight");
                     require(feeling.has_value() &&
                                 feeling->category == mem::MemoryCategory::Emotion,
                             "feeling is an emotion");
                   }});

  tests.push_back({"learner_weak_keyword_yields_to_later_rules", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});

                     const auto happy = learner.classify("I am happy today");
                     require(happy.has_value() &&
                                 happy->category == mem::MemoryCategory::Emotion &&
                                 happy->importance == 0.9,
                             "emotion outranks a bare am");
                     const auto worried = learner.classify("I am so worried about tomorrow");
                     require(worried.has_value() &&
                                 worried->category == mem::MemoryCategory::Emotion,
                             "worried is an emotion");

                     const auto age = learner.classify("I am 28 years old");
                     require(age.has_value() && age->category == mem::MemoryCategory::Fact &&
                                 age->importance == 0.7 && age->keyword == "am",
                             "am alone still makes a fact");
                     require(!learner.classify("Amazing").has_value(),
                             "short weak keywords match whole words only");

                     const auto strong = learner.classify("I am sure my dog is happy");
                     require(strong.has_value() && strong->category == mem::MemoryCategory::Fact &&
                                 strong->keyword == "is",
                             "a strong fact keyword keeps rule order");
                   }});

  tests.push_back({"learner_first_rule_wins", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});
                     const auto mixed = learner.classify("I feel happy because my dog is home");
                     require(mixed.has_value() && mixed->category == mem::MemoryCategory::Fact,
                             "fact rule precedes emotion");

                     engram::config::LearnerConfig reordered;
                     std::swap(reordered.rules[1], reordered.rules[2]);
                     mem::ConversationLearner emotion_first(writer, reordered);
                     const auto again = emotion_first.classify("I feel happy because my dog is home");
                     require(again.has_value() && again->category == mem::MemoryCategory::Emotion,
                             "configured order decides");
                   }});

  tests.push_back({"learner_stores_user_turns_only", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});
                     const std::vector<mem::ChatTurn> turns = {
                         {.role = "user", .content = "I love jazz"},
                         {.role = "assistant", .content = "I love jazz too"},
                         {.role = " User ", .content = "ok"},
                         {.role = "USER", .content = "My sister is a nurse"},
                     };
                     const auto learned = learner.learn(mem::PersonaMemoryConfig{}, "alice", turns);
                     require(learned.ok(), learned.error());
                     require(learned.value().size() == 2, "two user turns learned");
                     require(learned.value()[1].content == "My sister is a nurse",
                             "learned turns keep conversation order");
                     require(writer.stored.size() == 2, "two memories written");
                     require(writer.stored[0].owner_id == "alice", "owner passed through");
                     require(writer.stored[0].context.at("source") == "conversation",
                             "source context set");
                     require(writer.stored[1].context.at("keyword") == "is",
                             "keyword context set");
                   }});

  tests.push_back({"learner_respects_persona_switches", [] {
                     RecordingWriter writer;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});
                     const std::vector<mem::ChatTurn> turns = {{.role = "user", .content = "I love tea"}};

                     const auto no_learning = learner.learn(
                         mem::PersonaMemoryConfig{.memory_enabled = true, .learning_enabled = false},
                         "alice", turns);
                     require(no_learning.ok() && no_learning.value().empty(), "learning disabled");
                     const auto no_memory = learner.learn(
                         mem::PersonaMemoryConfig{.memory_enabled = false, .learning_enabled = true},
                         "alice", turns);
                     require(no_memory.ok() && no_memory.value().empty(), "memory disabled");
                     require(writer.stored.empty(), "nothing written");
                   }});

  tests.push_back({"learner_skips_failed_writes", [] {
                     RecordingWriter writer;
                     writer.fail_with = common::ErrorCode::Storage;
                     mem::ConversationLearner learner(writer, engram::config::LearnerConfig{});
                     const std::vector<mem::ChatTurn> turns = {{.role = "user", .content = "I love tea"}};
                     const auto learned = learner.learn(mem::PersonaMemoryConfig{}, "alice", turns);
                     require(learned.ok() && learned.value().empty(),
                             "storage failures drop the turn");

                     writer.fail_with = common::ErrorCode::Validation;
                     const auto invalid = learner.learn(mem::PersonaMemoryConfig{}, "alice", turns);
                     require(!invalid.ok() && invalid.code() == common::ErrorCode::Validation,
                             "validation failures propagate");
                   }});

  tests.push_back({"learner_ignores_unknown_rule_categories", [] {
                     RecordingWriter writer;
                     engram::config::LearnerConfig config;
                     config.rules = {{"daily", 0.5, {"today"}}, {"emotion", 1.5, {"today"}}};
                     mem::ConversationLearner learner(writer, config);
                     const auto result = learner.classify("today was long");
                     require(result.has_value() && result->category == mem::MemoryCategory::Emotion,
                             "unknown category rule skipped");
                     require(result->importance == 1.0, "rule importance clamped");
                   }});
}
