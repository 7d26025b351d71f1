#pragma once

#include "ledger/domain/invoice.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/workflow/invocation_context.hpp"

#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// InvoiceWorkflow
// -----------------------------------------------------------------------------
//
// @brief  Creator-issued invoices that the client approves and pays.
//
// @details
// Lifecycle:
//
//   Draft ──mark_sent──► Sent ──approve──► Approved ──execute──► Executed
//     │                   │                   │
//     ├──reject──► Rejected ◄──reject──┘      │
//     │                                       │
//     └── late approve ──► Expired ◄── due passes (Sent, Approved)
//
// Executed, Rejected and Expired are terminal.
//
// Check order for approve():
//   InvoiceNotFound → Unauthorized (client has not authorized)
//   → Unauthorized (caller is not the invoice's client)
//   → InvoiceAlreadyApproved (status not Draft/Sent)
//   → InvoiceExpired (now > due; Expired is persisted first)
//
// approve() and execute() persist the Expired status AND return
// InvoiceExpired when the due date has passed. check_expiration() expires
// only Sent and Approved invoices and otherwise reports the status as is.
//
// The rejection reason is stored for audit and never interpreted.
// -----------------------------------------------------------------------------
class InvoiceWorkflow {
 public:
  Result<domain::InvoiceResult> create(InvocationContext& ctx,
                                       const domain::Party& creator,
                                       const domain::Party& client,
                                       domain::Amount amount,
                                       const std::string& description,
                                       domain::LedgerTime due_date);

  Result<domain::InvoiceResult> markSent(InvocationContext& ctx,
                                         domain::EntityId id,
                                         const domain::Party& creator);

  Result<domain::InvoiceResult> approve(InvocationContext& ctx,
                                        domain::EntityId id,
                                        const domain::Party& client);

  Result<domain::InvoiceResult> execute(InvocationContext& ctx,
                                        domain::EntityId id);

  Result<domain::InvoiceResult> reject(InvocationContext& ctx,
                                       domain::EntityId id,
                                       const domain::Party& client,
                                       const std::string& reason);

  Result<domain::InvoiceResult> checkExpiration(InvocationContext& ctx,
                                                domain::EntityId id);

  Result<domain::Invoice> get(InvocationContext& ctx,
                              domain::EntityId id) const;

 private:
  // Persist a status change and publish it.
  void transition(InvocationContext& ctx, domain::Invoice& invoice,
                  domain::InvoiceStatus next,
                  const std::optional<std::string>& confirmation = std::nullopt);
};

}  // namespace ledger
