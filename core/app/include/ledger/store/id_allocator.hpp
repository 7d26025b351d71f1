#pragma once

#include "ledger/domain/types.hpp"
#include "ledger/store/i_durable_store.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// IdAllocator: durable, per-kind monotonically increasing identifiers
// -----------------------------------------------------------------------------
//
// @brief  Issues the id for every new transaction, escrow and invoice. Each
//         entity kind has its own counter stored at keys::counter(kind).
//
// @details
// next(kind) reads the counter (absent = 0), increments it, writes it back
// and returns the new value. The first id of every kind is therefore 1; id 0
// is never issued and may be used as an "unset" sentinel.
//
// The allocator writes to the store it was constructed with. The engine
// constructs it over the backing durable store rather than the per-invocation
// overlay, so a counter advanced by an invocation that later faults is not
// rolled back. Ids may skip; they never repeat.
//
// Ownership:
//   Owned by LedgerEngine as a value member; workflows reach it through the
//   InvocationContext.
// -----------------------------------------------------------------------------
class IdAllocator {
 public:
  explicit IdAllocator(IDurableStore& store) : store_(store) {}

  IdAllocator(const IdAllocator&) = delete;
  IdAllocator& operator=(const IdAllocator&) = delete;

  // -------------------------------------------------------------------------
  // next(kind)
  // -------------------------------------------------------------------------
  // @return The next id for kind; strictly greater than every id previously
  //         returned for that kind by any allocator over the same store.
  //
  // Side-effects: Persists the advanced counter.
  // -------------------------------------------------------------------------
  domain::EntityId next(domain::EntityKind kind);

  // Last id issued for kind (0 if none). Read-only.
  domain::EntityId current(domain::EntityKind kind) const;

 private:
  IDurableStore& store_;
};

}  // namespace ledger
