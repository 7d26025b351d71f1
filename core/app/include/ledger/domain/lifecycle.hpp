#pragma once

#include "ledger/domain/condition.hpp"
#include "ledger/domain/escrow.hpp"
#include "ledger/domain/invoice.hpp"
#include "ledger/domain/transaction.hpp"

#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Lifecycle tables
// -----------------------------------------------------------------------------
//
// @brief  Pure functions describing each entity's legal transition graph,
//         plus the canonical names used in persisted records, logs, and the
//         JSON command surface.
//
// @details
// The workflows check every proposed status change against these tables
// before persisting it. A workflow that computes an illegal transition has a
// bug; the tables are the single statement of which edges exist.
//
// Thread model: stateless, safe from any context.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// canTransition(current, next)
// -------------------------------------------------------------------------
// Transactions:  Pending → Confirmed, Failed, Cancelled
// Escrows:       Active  → Released, Refunded
// Invoices:      Draft    → Sent, Approved, Rejected, Expired
//                Sent     → Approved, Rejected, Expired
//                Approved → Executed, Expired
// Everything else (including self-loops) is illegal.
// -------------------------------------------------------------------------
bool canTransition(TransactionStatus current, TransactionStatus next);
bool canTransition(EscrowStatus current, EscrowStatus next);
bool canTransition(InvoiceStatus current, InvoiceStatus next);

bool isTerminal(EscrowStatus status);
bool isTerminal(InvoiceStatus status);

const char* to_string(TransactionKind kind);
const char* to_string(TransactionStatus status);
const char* to_string(EscrowStatus status);
const char* to_string(InvoiceStatus status);
const char* to_string(ConditionKind kind);
const char* to_string(EntityKind kind);

// Inverse of to_string; std::nullopt for unknown names.
std::optional<TransactionKind> parseTransactionKind(const std::string& name);
std::optional<TransactionStatus> parseTransactionStatus(const std::string& name);
std::optional<EscrowStatus> parseEscrowStatus(const std::string& name);
std::optional<InvoiceStatus> parseInvoiceStatus(const std::string& name);
std::optional<ConditionKind> parseConditionKind(const std::string& name);

}  // namespace domain
}  // namespace ledger
