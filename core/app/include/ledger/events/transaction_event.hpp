#pragma once

#include "ledger/domain/transaction.hpp"

#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// TransactionEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by TransactionWorkflow when a transaction reaches its
//         final persisted status (Confirmed, or Failed when the value-transfer
//         layer refused the movement).
//
// @details
// The transaction field is a copy of the record as persisted. confirmation
// carries the transfer reference and is empty for Failed transactions.
//
// Published synchronously inside the invocation that produced it, while the
// reentrancy guard is still held.
// -----------------------------------------------------------------------------
struct TransactionEvent {
  domain::Transaction transaction;  // Snapshot after the transition
  std::string confirmation;
  domain::LedgerTime ledger_time{0};
};

}  // namespace ledger
