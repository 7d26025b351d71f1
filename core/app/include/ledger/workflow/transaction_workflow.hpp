#pragma once

#include "ledger/domain/result.hpp"
#include "ledger/domain/transaction.hpp"
#include "ledger/workflow/invocation_context.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// TransactionWorkflow
// -----------------------------------------------------------------------------
//
// @brief  Direct value transfers between two parties. A transaction is
//         created Pending and settled within the same operation.
//
// @details
// create() sequence:
//   1. enter the invocation (ReentrancyDetected if nested)
//   2. sender and recipient must be valid parties       → InvalidAddress
//   3. 0 < amount <= headroom maximum                    → InvalidAmount
//   4. sender must have authorized the invocation        → Unauthorized
//   5. allocate an id, persist Pending, index both parties
//   6. move the value through IValueTransfer
//        refused → persist Failed, publish, return the transfer's error
//        ok      → persist Confirmed, publish, return the reference
//
// Basic and P2P transactions follow the same path; kind is recorded on the
// record for the caller's benefit.
//
// history() reads the party index, a list of transaction ids in ascending
// order. Sender and recipient are both indexed, once if they are the same
// party. offset/limit page the list; limit 0 means no limit.
// -----------------------------------------------------------------------------
class TransactionWorkflow {
 public:
  Result<domain::TransactionResult> create(InvocationContext& ctx,
                                           const domain::Party& sender,
                                           const domain::Party& recipient,
                                           domain::Amount amount,
                                           const std::string& metadata,
                                           domain::TransactionKind kind);

  Result<domain::Transaction> get(InvocationContext& ctx,
                                  domain::EntityId id) const;

  Result<std::vector<domain::Transaction>> history(
      InvocationContext& ctx, const domain::Party& party,
      std::size_t offset = 0, std::size_t limit = 0) const;
};

}  // namespace ledger
