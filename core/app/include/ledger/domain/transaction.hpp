#pragma once

#include "ledger/domain/amount.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <string>

namespace ledger {
namespace domain {

enum class TransactionKind {
  Basic,
  P2P,
};

// -----------------------------------------------------------------------------
// TransactionStatus
// -----------------------------------------------------------------------------
// Pending → Confirmed is the only transition, and it happens inside the same
// invocation that creates the record, so callers only ever observe
// Confirmed. Failed and Cancelled are part of the persisted vocabulary but no
// operation currently produces them.
// -----------------------------------------------------------------------------
enum class TransactionStatus {
  Pending,
  Confirmed,
  Failed,
  Cancelled,
};

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
// Responsibility: Snapshot of a direct transfer between two parties.
// Created once by TransactionWorkflow, never deleted. The RecordStore holds
// the authoritative copy; values returned to callers are copies.
// -----------------------------------------------------------------------------
struct Transaction {
  EntityId id{};
  TransactionKind kind{TransactionKind::Basic};
  Party sender;
  Party recipient;
  Amount amount{0};
  TransactionStatus status{TransactionStatus::Pending};
  LedgerTime created_at{0};
  std::string metadata;  // Free-form memo, stored verbatim
};

// Returned by execute_transaction / execute_p2p_transaction.
struct TransactionResult {
  EntityId transaction_id{};
  TransactionStatus status{TransactionStatus::Pending};
  std::string confirmation;  // Reference issued by the value-transfer layer
};

}  // namespace domain
}  // namespace ledger
