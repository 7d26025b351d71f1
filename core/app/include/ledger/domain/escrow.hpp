#pragma once

#include "ledger/domain/amount.hpp"
#include "ledger/domain/condition.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// EscrowStatus: escrow lifecycle state machine
// -----------------------------------------------------------------------------
//
//   Active ──> Released   (conditions met, not expired)
//     │
//     └─────> Refunded    (expired)
//
// Terminal states: Released, Refunded. Nothing leaves a terminal state.
// -----------------------------------------------------------------------------
enum class EscrowStatus {
  Active,
  Released,
  Refunded,
};

// -----------------------------------------------------------------------------
// Escrow
// -----------------------------------------------------------------------------
// Responsibility: Value locked by `sender` for `recipient` until every
// condition holds (release) or `expires_at` passes (refund).
//
// Invariants:
//   - expires_at > created_at (checked at creation against the ledger clock).
//   - conditions are immutable after creation; order is evaluation order.
// -----------------------------------------------------------------------------
struct Escrow {
  EntityId id{};
  Party sender;
  Party recipient;
  Amount amount{0};
  std::vector<Condition> conditions;
  EscrowStatus status{EscrowStatus::Active};
  LedgerTime created_at{0};
  LedgerTime expires_at{0};
};

// Returned by create/release/refund/process. `confirmation` is present only
// when value actually moved.
struct EscrowResult {
  EntityId escrow_id{};
  EscrowStatus status{EscrowStatus::Active};
  std::optional<std::string> confirmation;
};

}  // namespace domain
}  // namespace ledger
