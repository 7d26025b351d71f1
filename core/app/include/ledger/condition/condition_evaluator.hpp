#pragma once

#include "ledger/condition/i_condition_backends.hpp"
#include "ledger/domain/condition.hpp"

#include <vector>

namespace ledger {

// Inputs shared by every condition evaluated for one escrow.
struct EvaluationContext {
  domain::EntityId escrow_id{};
  domain::LedgerTime now{0};
};

// -----------------------------------------------------------------------------
// ConditionEvaluator
// -----------------------------------------------------------------------------
//
// @brief  Decides whether an escrow's release conditions hold.
//
// @details
// evaluate() dispatches on the condition variant with std::visit:
//
//   TimeBased{not_before}      : now >= not_before
//   OracleBased{feed,expected} : oracle backend, asked at the condition's
//                                validator, reports exactly `expected`
//   ManualApproval{}           : approval registry holds a sign-off from the
//                                validator for this escrow
//
// evaluateAll() is the AND of evaluate() over the sequence in order. It
// stops at the first unmet condition; later backends are not consulted. An
// empty sequence is vacuously met.
//
// Both calls are side-effect-free and give the same answer for the same
// inputs and backend state.
//
// Ownership:
//   Holds const references to the two backends; the engine owns them.
// -----------------------------------------------------------------------------
class ConditionEvaluator {
 public:
  ConditionEvaluator(const IOracleBackend& oracle,
                     const IApprovalRegistry& approvals)
      : oracle_(oracle), approvals_(approvals) {}

  bool evaluate(const domain::Condition& condition,
                const EvaluationContext& ctx) const;

  bool evaluateAll(const std::vector<domain::Condition>& conditions,
                   const EvaluationContext& ctx) const;

 private:
  const IOracleBackend& oracle_;
  const IApprovalRegistry& approvals_;
};

}  // namespace ledger
