#pragma once

#include "ledger/domain/amount.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/domain/types.hpp"

#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// TransferRequest: one movement of value between two parties
// -----------------------------------------------------------------------------
// kind/id/action identify the workflow step that asked for the movement
// (e.g. Escrow 7 "release") and feed deterministic reference generation.
// memo is free text carried through for audit.
// -----------------------------------------------------------------------------
struct TransferRequest {
  domain::Party from;
  domain::Party to;
  domain::Amount amount{0};
  std::string memo;
  domain::EntityKind kind{domain::EntityKind::Transaction};
  domain::EntityId id{};
  std::string action;
};

// -----------------------------------------------------------------------------
// IValueTransfer
// -----------------------------------------------------------------------------
//
// @brief  Native value movement consumed by the workflows. The returned
//         reference is the confirmation token handed back to callers.
//
// @details
// Implementations may refuse a movement with InsufficientBalance (or any
// other ContractError); the workflow surfaces the error unchanged. A
// refused transfer must not have moved anything.
//
// Called while the reentrancy guard is held. An implementation that calls
// back into a mutating engine operation receives ReentrancyDetected.
// -----------------------------------------------------------------------------
class IValueTransfer {
 public:
  virtual ~IValueTransfer() = default;

  virtual Result<std::string> transfer(const TransferRequest& request) = 0;
};

}  // namespace ledger
