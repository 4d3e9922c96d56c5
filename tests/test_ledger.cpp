#include "test_framework.hpp"

#include "engram/memory/sqlite_ledger.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <string>

namespace {

using engram::memory::MemoryCategory;
using engram::memory::NewMemory;

NewMemory make_memory(const std::string &owner, const std::string &content, double importance,
                      MemoryCategory category = MemoryCategory::Conversation) {
  NewMemory memory;
  memory.owner_id = owner;
  memory.content = content;
  memory.importance = importance;
  memory.category = category;
  return memory;
}

std::unique_ptr<engram::memory::SqliteLedger>
open_ledger(const engram::testing::TempWorkspace &workspace) {
  auto ledger = engram::memory::SqliteLedger::open(workspace.path() / "ledger.db");
  engram::tests::require(ledger.ok(), ledger.ok() ? "" : ledger.error());
  return std::move(ledger.value());
}

} // namespace

void register_ledger_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  namespace mem = engram::memory;
  namespace common = engram::common;
  using engram::testing::ManualClock;
  using engram::testing::TempWorkspace;
  using namespace std::chrono_literals;

  tests.push_back({"ledger_insert_clamps_and_stamps", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;

                     auto memory = make_memory("alice", "likes tea", 1.4, MemoryCategory::Preference);
                     memory.context = {{"source", "test"}};
                     const auto stored = ledger->insert(memory, clock.now());
                     require(stored.ok(), stored.error());
                     require(stored.value().id > 0, "id assigned");
                     require(stored.value().importance == 1.0, "importance clamped");
                     require(stored.value().created_at == clock.now(), "created stamp");

                     const auto loaded = ledger->get(stored.value().id);
                     require(loaded.ok() && loaded.value().has_value(), "row should load");
                     const auto &row = *loaded.value();
                     require(row.category == MemoryCategory::Preference, "category round trip");
                     require(row.context.at("source") == "test", "context round trip");
                     require(row.last_accessed_at == clock.now(), "accessed stamp");
                     require(!row.expires_at.has_value(), "no expiry by default");

                     const auto missing = ledger->get(stored.value().id + 100);
                     require(missing.ok() && !missing.value().has_value(), "unknown id is empty");
                   }});

  tests.push_back({"ledger_rejects_blank_owner_and_content", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;
                     const auto no_owner = ledger->insert(make_memory("  ", "text", 0.5), clock.now());
                     require(!no_owner.ok() && no_owner.code() == common::ErrorCode::Validation,
                             "blank owner is a validation error");
                     const auto no_content = ledger->insert(make_memory("alice", "\n", 0.5),
                                                            clock.now());
                     require(!no_content.ok() && no_content.code() == common::ErrorCode::Validation,
                             "blank content is a validation error");
                     const auto total = ledger->count(std::nullopt);
                     require(total.ok() && total.value() == 0, "nothing was written");
                   }});

  tests.push_back({"ledger_candidates_order_by_importance_then_recency", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;

                     const auto low = ledger->insert(make_memory("alice", "low", 0.3), clock.now());
                     clock.advance(1s);
                     const auto older = ledger->insert(make_memory("alice", "older", 0.8), clock.now());
                     clock.advance(1s);
                     const auto newer = ledger->insert(make_memory("alice", "newer", 0.8), clock.now());
                     require(low.ok() && older.ok() && newer.ok(), "inserts should succeed");
                     require(ledger->insert(make_memory("bob", "other", 1.0), clock.now()).ok(),
                             "bob insert");

                     const auto rows = ledger->query_candidates(
                         mem::CandidateFilter{.owner_id = "alice"}, clock.now());
                     require(rows.ok(), rows.error());
                     require(rows.value().size() == 3, "only alice's rows");
                     require(rows.value()[0].content == "newer", "recency breaks importance ties");
                     require(rows.value()[1].content == "older", "older second");
                     require(rows.value()[2].content == "low", "low importance last");

                     require(ledger->touch({older.value().id}, clock.now() + 1s).ok(), "touch");
                     const auto touched = ledger->query_candidates(
                         mem::CandidateFilter{.owner_id = "alice"}, clock.now());
                     require(touched.ok() && touched.value()[0].content == "older",
                             "touch moves the row ahead of its tie");
                   }});

  tests.push_back({"ledger_touch_leaves_connection_ready_for_writes", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;

                     const auto kept = ledger->insert(make_memory("alice", "kept", 0.5), clock.now());
                     auto expiring = make_memory("alice", "expiring", 0.5);
                     expiring.expires_at = clock.now() + 1s;
                     require(kept.ok() && ledger->insert(expiring, clock.now()).ok(), "inserts");

                     for (int round = 1; round <= 3; ++round) {
                       clock.advance(1s);
                       require(ledger->touch({kept.value().id, 9999}, clock.now()).ok(),
                               "touch round " + std::to_string(round));
                       const auto purged = ledger->purge_expired(clock.now());
                       require(purged.ok(), purged.ok() ? "" : purged.error());
                       require(purged.value().size() == (round == 1 ? 1U : 0U),
                               "expiring row purged once");
                     }

                     const auto row = ledger->get(kept.value().id);
                     require(row.ok() && row.value().has_value(), "kept row readable");
                     require(row.value()->last_accessed_at == clock.now(),
                             "last touch recorded");
                     require(ledger->insert(make_memory("alice", "later", 0.5), clock.now()).ok(),
                             "insert after touches");
                   }});

  tests.push_back({"ledger_candidates_apply_filters", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;
                     require(ledger->insert(make_memory("alice", "tea", 0.8, MemoryCategory::Preference),
                                            clock.now())
                                 .ok(),
                             "insert pref");
                     require(ledger->insert(make_memory("alice", "28", 0.7, MemoryCategory::Fact),
                                            clock.now())
                                 .ok(),
                             "insert fact");
                     require(ledger->insert(make_memory("alice", "hi", 0.2), clock.now()).ok(),
                             "insert chat");

                     const auto prefs = ledger->query_candidates(
                         mem::CandidateFilter{.owner_id = "alice",
                                              .categories = {MemoryCategory::Preference,
                                                             MemoryCategory::Emotion}},
                         clock.now());
                     require(prefs.ok() && prefs.value().size() == 1 &&
                                 prefs.value()[0].content == "tea",
                             "category filter");

                     const auto important = ledger->query_candidates(
                         mem::CandidateFilter{.owner_id = "alice", .min_importance = 0.7},
                         clock.now());
                     require(important.ok() && important.value().size() == 2,
                             "threshold is inclusive");
                   }});

  tests.push_back({"ledger_hides_and_purges_expired_rows", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;

                     auto expiring = make_memory("alice", "short lived", 0.9);
                     expiring.expires_at = clock.now() + 10s;
                     const auto stored = ledger->insert(expiring, clock.now());
                     require(stored.ok(), stored.error());
                     require(ledger->insert(make_memory("alice", "durable", 0.5), clock.now()).ok(),
                             "durable insert");

                     auto visible = ledger->query_candidates(
                         mem::CandidateFilter{.owner_id = "alice"}, clock.now());
                     require(visible.ok() && visible.value().size() == 2, "both visible before expiry");

                     clock.advance(10s);
                     visible = ledger->query_candidates(mem::CandidateFilter{.owner_id = "alice"},
                                                        clock.now());
                     require(visible.ok() && visible.value().size() == 1,
                             "expiry instant is already expired");
                     const auto all_rows = ledger->list_for_owner("alice");
                     require(all_rows.ok() && all_rows.value().size() == 2,
                             "expired row still stored until purged");

                     const auto purged = ledger->purge_expired(clock.now());
                     require(purged.ok(), purged.error());
                     require(purged.value().size() == 1, "one row purged");
                     require(purged.value()[0].id == stored.value().id &&
                                 purged.value()[0].owner_id == "alice",
                             "purge reports id and owner");

                     const auto again = ledger->purge_expired(clock.now());
                     require(again.ok() && again.value().empty(), "purge is idempotent");
                   }});

  tests.push_back({"ledger_remove_reports_owner", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;
                     const auto stored = ledger->insert(make_memory("bob", "note", 0.5), clock.now());
                     require(stored.ok(), stored.error());

                     const auto removed = ledger->remove(stored.value().id);
                     require(removed.ok() && removed.value().has_value(), "remove should hit");
                     require(removed.value()->owner_id == "bob", "owner reported");
                     const auto second = ledger->remove(stored.value().id);
                     require(second.ok() && !second.value().has_value(), "second remove misses");
                   }});

  tests.push_back({"ledger_lists_owners_and_counts", [] {
                     TempWorkspace workspace;
                     auto ledger = open_ledger(workspace);
                     ManualClock clock;
                     for (const auto *owner : {"carol", "alice", "carol"}) {
                       require(ledger->insert(make_memory(owner, "x", 0.5), clock.now()).ok(),
                               "insert");
                     }
                     const auto owners = ledger->list_owners();
                     require(owners.ok() && owners.value().size() == 2, "distinct owners");
                     require(owners.value()[0] == "alice", "owners are sorted");
                     const auto carol = ledger->count(std::string("carol"));
                     require(carol.ok() && carol.value() == 2, "per-owner count");
                     const auto total = ledger->count(std::nullopt);
                     require(total.ok() && total.value() == 3, "total count");
                     require(ledger->health_check(), "ledger should be healthy");
                   }});

  tests.push_back({"ledger_persists_across_reopen", [] {
                     TempWorkspace workspace;
                     ManualClock clock;
                     mem::MemoryId id = 0;
                     {
                       auto ledger = open_ledger(workspace);
                       const auto stored =
                           ledger->insert(make_memory("alice", "remember me", 0.6), clock.now());
                       require(stored.ok(), stored.error());
                       id = stored.value().id;
                     }
                     auto reopened = open_ledger(workspace);
                     const auto loaded = reopened->get(id);
                     require(loaded.ok() && loaded.value().has_value() &&
                                 loaded.value()->content == "remember me",
                             "row should survive reopen");
                   }});
}
