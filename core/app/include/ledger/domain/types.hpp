#pragma once

#include <cstdint>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// EntityId
// -----------------------------------------------------------------------------
// Identifier issued by the IdAllocator. Counters are per entity kind, so a
// transaction and an escrow may share the same numeric id. 0 is never issued
// and serves as the "unset" sentinel.
// -----------------------------------------------------------------------------
using EntityId = std::uint64_t;

// Ledger clock reading in seconds, supplied by ILedgerClock.
using LedgerTime = std::uint64_t;

// The three persisted agreement kinds. Each has its own id counter and its
// own record key space.
enum class EntityKind {
  Transaction,
  Escrow,
  Invoice,
};

}  // namespace domain
}  // namespace ledger
