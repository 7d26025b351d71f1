#include "ledger/condition/condition_evaluator.hpp"

#include <type_traits>
#include <variant>

namespace ledger {

bool ConditionEvaluator::evaluate(const domain::Condition& condition,
                                  const EvaluationContext& ctx) const {
  return std::visit(
      [&](const auto& spec) -> bool {
        using T = std::decay_t<decltype(spec)>;

        if constexpr (std::is_same_v<T, domain::TimeBasedCondition>) {
          return ctx.now >= spec.not_before;
        } else if constexpr (std::is_same_v<T, domain::OracleBasedCondition>) {
          auto observed = oracle_.observe(condition.validator, spec.feed);
          return observed.has_value() && *observed == spec.expected;
        } else {
          return approvals_.hasApproved(condition.validator, ctx.escrow_id);
        }
      },
      condition.spec);
}

// -----------------------------------------------------------------------------
// evaluateAll(): in order, first unmet condition ends the scan
// -----------------------------------------------------------------------------
bool ConditionEvaluator::evaluateAll(
    const std::vector<domain::Condition>& conditions,
    const EvaluationContext& ctx) const {
  for (const auto& condition : conditions) {
    if (!evaluate(condition, ctx)) {
      return false;
    }
  }
  return true;
}

}  // namespace ledger
