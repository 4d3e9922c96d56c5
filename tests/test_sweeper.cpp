#include "test_framework.hpp"

#include "engram/memory/expiry_sweeper.hpp"
#include "engram/memory/sqlite_ledger.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>

namespace {

namespace mem = engram::memory;

mem::MemoryId insert_expiring(mem::ILedger &ledger, const std::string &owner,
                              const mem::Timestamp now, const mem::Timestamp expires_at) {
  mem::NewMemory memory;
  memory.owner_id = owner;
  memory.content = "temporary note";
  memory.importance = 0.5;
  memory.expires_at = expires_at;
  const auto stored = ledger.insert(memory, now);
  engram::tests::require(stored.ok(), stored.ok() ? "" : stored.error());
  return stored.value().id;
}

} // namespace

void register_sweeper_tests(std::vector<engram::tests::TestCase> &tests) {
  using engram::tests::require;
  using engram::testing::FailingVectorIndex;
  using engram::testing::ManualClock;
  using engram::testing::TempWorkspace;
  using namespace std::chrono_literals;

  tests.push_back({"sweeper_removes_ledger_rows_and_vectors", [] {
                     TempWorkspace workspace;
                     ManualClock clock;
                     auto ledger = mem::SqliteLedger::open(workspace.path() / "ledger.db");
                     require(ledger.ok(), ledger.error());
                     mem::FlatVectorIndex index;

                     const auto gone = insert_expiring(*ledger.value(), "alice", clock.now(),
                                                       clock.now() + 1min);
                     const auto kept = insert_expiring(*ledger.value(), "alice", clock.now(),
                                                       clock.now() + 1h);
                     require(index.upsert("alice", gone, {1.0F, 0.0F}, {}).ok(), "index gone");
                     require(index.upsert("alice", kept, {0.0F, 1.0F}, {}).ok(), "index kept");

                     mem::ExpirySweeper sweeper(*ledger.value(), &index);
                     clock.advance(2min);
                     const auto report = sweeper.run(clock.now());
                     require(report.ok(), report.error());
                     require(report.value().purged == 1, "one row purged");
                     require(report.value().index_failures == 0, "no index failures");
                     require(index.size("alice") == 1, "expired vector removed");

                     const auto remaining = ledger.value()->get(kept);
                     require(remaining.ok() && remaining.value().has_value(), "live row kept");

                     const auto repeat = sweeper.run(clock.now());
                     require(repeat.ok() && repeat.value().purged == 0, "second sweep is a no-op");
                   }});

  tests.push_back({"sweeper_counts_index_failures", [] {
                     TempWorkspace workspace;
                     ManualClock clock;
                     auto ledger = mem::SqliteLedger::open(workspace.path() / "ledger.db");
                     require(ledger.ok(), ledger.error());
                     FailingVectorIndex index;

                     insert_expiring(*ledger.value(), "alice", clock.now(), clock.now() + 1s);
                     insert_expiring(*ledger.value(), "bob", clock.now(), clock.now() + 1s);

                     mem::ExpirySweeper sweeper(*ledger.value(), &index);
                     clock.advance(1s);
                     const auto report = sweeper.run(clock.now());
                     require(report.ok(), "index failures never fail the sweep");
                     require(report.value().purged == 2, "both rows purged");
                     require(report.value().index_failures == 2, "both removals failed");
                     require(index.remove_calls == 2, "one removal per purged memory");

                     const auto total = ledger.value()->count(std::nullopt);
                     require(total.ok() && total.value() == 0, "ledger purge stands");
                   }});

  tests.push_back({"sweeper_without_index_only_purges", [] {
                     TempWorkspace workspace;
                     ManualClock clock;
                     auto ledger = mem::SqliteLedger::open(workspace.path() / "ledger.db");
                     require(ledger.ok(), ledger.error());
                     insert_expiring(*ledger.value(), "alice", clock.now(), clock.now());

                     mem::ExpirySweeper sweeper(*ledger.value(), nullptr);
                     const auto report = sweeper.run(clock.now());
                     require(report.ok() && report.value().purged == 1,
                             "expiry equal to now is purged");
                   }});
}
