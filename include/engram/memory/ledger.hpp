#pragma once

#include "engram/common/result.hpp"
#include "engram/memory/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace engram::memory {

struct CandidateFilter {
  std::string owner_id;
  std::vector<MemoryCategory> categories;
  double min_importance = 0.0;
};

struct PurgedMemory {
  MemoryId id = 0;
  std::string owner_id;
};

/// Durable store of memory records; the source of truth whenever the vector
/// index disagrees with it.
class ILedger {
public:
  virtual ~ILedger() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Validates, clamps importance and stamps created/last-accessed with `now`.
  [[nodiscard]] virtual common::Result<Memory> insert(const NewMemory &memory, Timestamp now) = 0;
  [[nodiscard]] virtual common::Result<std::optional<Memory>> get(MemoryId id) = 0;

  /// Non-expired memories for the owner matching the filter, ordered by
  /// importance desc, last_accessed_at desc, id desc.
  [[nodiscard]] virtual common::Result<std::vector<Memory>>
  query_candidates(const CandidateFilter &filter, Timestamp now) = 0;

  /// Sets last_accessed_at; unknown ids are ignored.
  [[nodiscard]] virtual common::Status touch(const std::vector<MemoryId> &ids, Timestamp now) = 0;

  /// Deletes every row with expires_at <= now and reports what went.
  [[nodiscard]] virtual common::Result<std::vector<PurgedMemory>> purge_expired(Timestamp now) = 0;

  [[nodiscard]] virtual common::Result<std::optional<PurgedMemory>> remove(MemoryId id) = 0;

  [[nodiscard]] virtual common::Result<std::vector<std::string>> list_owners() = 0;
  /// Every row of the owner, expired ones included, in id order.
  [[nodiscard]] virtual common::Result<std::vector<Memory>>
  list_for_owner(const std::string &owner_id) = 0;
  [[nodiscard]] virtual common::Result<std::size_t>
  count(const std::optional<std::string> &owner_id) = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

/// Shared input validation for ledger implementations.
[[nodiscard]] common::Status validate_new_memory(const NewMemory &memory);

} // namespace engram::memory
