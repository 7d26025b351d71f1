#pragma once

#include "ledger/condition/condition_evaluator.hpp"
#include "ledger/domain/escrow.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/workflow/invocation_context.hpp"

#include <set>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// EscrowWorkflow
// -----------------------------------------------------------------------------
//
// @brief  Conditional escrows: value locked by the sender, released to the
//         recipient once every condition holds, refunded to the sender once
//         the escrow expires.
//
// @details
// Lifecycle:  Active → Released | Refunded   (both terminal)
//
// Value path:
//   create   sender    → custody    ("lock")
//   release  custody   → recipient  ("release")
//   refund   custody   → sender     ("refund")
// custodyParty() is the fixed holding account.
//
// Temporal rules (expires_at compared with ledger time `now`):
//   now <= expires_at : release possible, refund refused (ConditionsNotMet)
//   now >  expires_at : refund possible, release refused (EscrowExpired)
//
// process() makes the choice itself under a single guard acquisition:
// expired → refund, conditions met → release, otherwise the escrow is left
// Active and an Active result is returned. Repeating process() on an Active
// escrow with unmet conditions changes nothing.
//
// Condition validators: OracleBased and ManualApproval conditions need a
// valid validator party; TimeBased conditions may leave it empty. When a
// trusted-validator list is configured, every named validator must be on it.
// Violations are InvalidAddress.
// -----------------------------------------------------------------------------
class EscrowWorkflow {
 public:
  explicit EscrowWorkflow(const ConditionEvaluator& evaluator,
                          std::set<domain::Party> trusted_validators = {});

  // Holding account for value locked in active escrows.
  static const domain::Party& custodyParty();

  Result<domain::EscrowResult> create(
      InvocationContext& ctx, const domain::Party& sender,
      const domain::Party& recipient, domain::Amount amount,
      const std::vector<domain::Condition>& conditions,
      domain::LedgerTime expires_at);

  // false (not an error) for a non-Active or expired escrow.
  Result<bool> conditionsMet(InvocationContext& ctx,
                             domain::EntityId id) const;

  Result<domain::EscrowResult> release(InvocationContext& ctx,
                                       domain::EntityId id);
  Result<domain::EscrowResult> refund(InvocationContext& ctx,
                                      domain::EntityId id);
  Result<domain::EscrowResult> process(InvocationContext& ctx,
                                       domain::EntityId id);

  Result<domain::Escrow> get(InvocationContext& ctx, domain::EntityId id) const;

 private:
  Status validateConditions(InvocationContext& ctx,
                            const std::vector<domain::Condition>& conditions) const;

  bool conditionsHold(InvocationContext& ctx,
                      const domain::Escrow& escrow) const;

  // Load an escrow that is still Active, else EscrowNotFound.
  Result<domain::Escrow> loadActive(InvocationContext& ctx,
                                    domain::EntityId id,
                                    const char* operation) const;

  // Called with the guard held and the escrow known to be Active.
  Result<domain::EscrowResult> releaseLocked(InvocationContext& ctx,
                                             domain::Escrow escrow);
  Result<domain::EscrowResult> refundLocked(InvocationContext& ctx,
                                            domain::Escrow escrow);

  // Persist a terminal transition and publish it.
  void settle(InvocationContext& ctx, domain::Escrow& escrow,
              domain::EscrowStatus next, const std::string& reference);

  const ConditionEvaluator& evaluator_;
  std::set<domain::Party> trusted_validators_;
};

}  // namespace ledger
