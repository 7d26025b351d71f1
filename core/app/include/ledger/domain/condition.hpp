#pragma once

#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <string>
#include <variant>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Condition payloads
// -----------------------------------------------------------------------------
//
// @brief  One struct per condition kind, each carrying exactly the
//         parameters its predicate needs.
//
// @details
// TimeBasedCondition      met once the ledger clock reaches not_before.
// OracleBasedCondition    met once the oracle at the condition's validator
//                         reports `expected` for `feed`.
// ManualApprovalCondition met once the validator has recorded an approval
//                         for the escrow in the approval registry.
//
// All payloads are immutable after the escrow is created.
// -----------------------------------------------------------------------------
struct TimeBasedCondition {
  LedgerTime not_before{0};
};

struct OracleBasedCondition {
  std::string feed;
  std::string expected;
};

struct ManualApprovalCondition {};

using ConditionSpec = std::variant<TimeBasedCondition, OracleBasedCondition,
                                   ManualApprovalCondition>;

enum class ConditionKind {
  TimeBased,
  OracleBased,
  ManualApproval,
};

// -----------------------------------------------------------------------------
// Condition
// -----------------------------------------------------------------------------
// Responsibility: A typed predicate gating escrow release. `validator` names
// the party whose backend adjudicates the predicate (oracle contract,
// approving signer); TimeBased conditions carry one too, for audit only.
// -----------------------------------------------------------------------------
struct Condition {
  ConditionSpec spec{ManualApprovalCondition{}};
  Party validator;

  ConditionKind kind() const {
    return static_cast<ConditionKind>(spec.index());
  }
};

}  // namespace domain
}  // namespace ledger
