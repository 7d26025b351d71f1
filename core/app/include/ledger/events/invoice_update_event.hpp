#pragma once

#include "ledger/domain/invoice.hpp"

#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// InvoiceUpdateEvent
// -----------------------------------------------------------------------------
// Published by InvoiceWorkflow on creation and on every persisted status
// change, including expiry side effects of a failed approve/execute.
// reason carries the client's rejection reason for Rejected transitions.
// -----------------------------------------------------------------------------
struct InvoiceUpdateEvent {
  domain::EntityId invoice_id{};
  domain::InvoiceStatus previous_status{domain::InvoiceStatus::Draft};
  domain::InvoiceStatus status{domain::InvoiceStatus::Draft};
  std::optional<std::string> confirmation;
  std::optional<std::string> reason;
  domain::LedgerTime ledger_time{0};
};

}  // namespace ledger
