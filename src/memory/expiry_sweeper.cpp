#include "engram/memory/expiry_sweeper.hpp"

#include "engram/observability/global.hpp"

namespace engram::memory {

ExpirySweeper::ExpirySweeper(ILedger &ledger, IVectorIndex *index)
    : ledger_(ledger), index_(index) {}

common::Result<SweepReport> ExpirySweeper::run(const Timestamp now) {
  auto purged = ledger_.purge_expired(now);
  if (!purged.ok()) {
    return common::Result<SweepReport>::failure_from(purged);
  }

  SweepReport report;
  report.purged = purged.value().size();
  if (index_ != nullptr) {
    for (const auto &memory : purged.value()) {
      auto removed = index_->remove(memory.owner_id, memory.id);
      if (!removed.ok()) {
        ++report.index_failures;
        observability::record_error("sweeper", "index removal failed for memory " +
                                                   std::to_string(memory.id) + ": " +
                                                   removed.error());
      }
    }
  }

  observability::record_sweep(report.purged, report.index_failures);
  return common::Result<SweepReport>::success(report);
}

} // namespace engram::memory
