#pragma once

#include "engram/memory/ledger.hpp"
#include "engram/memory/vector_index.hpp"

namespace engram::memory {

struct SweepReport {
  std::size_t purged = 0;
  std::size_t index_failures = 0;
};

/// Deletes expired memories from the ledger and their vectors from the index.
/// Index removals are best-effort: a failure is counted and logged, never fatal.
class ExpirySweeper {
public:
  ExpirySweeper(ILedger &ledger, IVectorIndex *index);

  [[nodiscard]] common::Result<SweepReport> run(Timestamp now);

private:
  ILedger &ledger_;
  IVectorIndex *index_;
};

} // namespace engram::memory
