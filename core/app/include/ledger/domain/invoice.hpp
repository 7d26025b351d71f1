#pragma once

#include "ledger/domain/amount.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// InvoiceStatus: invoice lifecycle state machine
// -----------------------------------------------------------------------------
//
//   Draft ──> Sent ──> Approved ──> Executed
//     │        │  │        │
//     │        │  └────────┴──────> Expired   (due date passed)
//     └────────┴──────────────────> Rejected  (client declined)
//
// A late approve() on a Draft invoice also lands in Expired.
// Terminal states: Executed, Rejected, Expired.
// -----------------------------------------------------------------------------
enum class InvoiceStatus {
  Draft,
  Sent,
  Approved,
  Executed,
  Rejected,
  Expired,
};

// -----------------------------------------------------------------------------
// Invoice
// -----------------------------------------------------------------------------
// Responsibility: A payment request from `creator` to `client`, payable once
// the client approves it and before `due_date`.
//
// approved_at is stamped on the transition to Approved and kept afterwards,
// so an Executed invoice always carries the time it was approved.
// rejection_reason is audit data only; nothing branches on it.
// -----------------------------------------------------------------------------
struct Invoice {
  EntityId id{};
  Party creator;
  Party client;
  Amount amount{0};
  std::string description;
  InvoiceStatus status{InvoiceStatus::Draft};
  LedgerTime created_at{0};
  LedgerTime due_date{0};
  std::optional<LedgerTime> approved_at;
  std::optional<std::string> rejection_reason;
};

struct InvoiceResult {
  EntityId invoice_id{};
  InvoiceStatus status{InvoiceStatus::Draft};
  std::optional<std::string> confirmation;
};

}  // namespace domain
}  // namespace ledger
