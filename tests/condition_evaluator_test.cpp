// =============================================================================
// condition_evaluator_test.cpp
// =============================================================================
// Unit tests for ConditionEvaluator.
//
// Validates:
//   - TimeBased: met once ledger time reaches not_before
//   - OracleBased: met only when the validator's oracle reports the exact
//     expected value for the feed
//   - ManualApproval: met only with a sign-off for this escrow
//   - evaluateAll: empty is true, AND semantics, short-circuit on the first
//     unmet condition (later backends never consulted)
// =============================================================================

#include "ledger/condition/condition_evaluator.hpp"
#include "ledger/condition/in_memory_backends.hpp"

#include <gtest/gtest.h>

#include <vector>

using ledger::domain::Condition;
using ledger::domain::ManualApprovalCondition;
using ledger::domain::OracleBasedCondition;
using ledger::domain::Party;
using ledger::domain::TimeBasedCondition;

namespace {

// Oracle that counts how often it is asked.
class CountingOracle : public ledger::IOracleBackend {
 public:
  mutable int calls = 0;

  std::optional<std::string> observe(const Party&,
                                     const std::string&) const override {
    ++calls;
    return std::string("yes");
  }
};

}  // namespace

// =============================================================================
// Fixture: in-memory backends and an evaluator over them.
// =============================================================================
class ConditionEvaluatorTest : public ::testing::Test {
 protected:
  ledger::InMemoryOracle oracle;
  ledger::InMemoryApprovalRegistry approvals;
  ledger::ConditionEvaluator evaluator{oracle, approvals};

  const Party feed_oracle{"oracle-1"};
  const Party notary{"notary"};
};

// -----------------------------------------------------------------------------
// 1. TimeBased boundary: not_before itself counts as reached.
// -----------------------------------------------------------------------------
TEST_F(ConditionEvaluatorTest, TimeBasedBoundary) {
  Condition c{TimeBasedCondition{100}, Party{}};

  EXPECT_FALSE(evaluator.evaluate(c, {1, 99}));
  EXPECT_TRUE(evaluator.evaluate(c, {1, 100}));
  EXPECT_TRUE(evaluator.evaluate(c, {1, 101}));
}

// -----------------------------------------------------------------------------
// 2. OracleBased: absent, wrong value, wrong oracle, right value.
// -----------------------------------------------------------------------------
TEST_F(ConditionEvaluatorTest, OracleBasedRequiresExactValueFromValidator) {
  Condition c{OracleBasedCondition{"delivery", "confirmed"}, feed_oracle};

  EXPECT_FALSE(evaluator.evaluate(c, {1, 0}));

  oracle.publish(feed_oracle, "delivery", "pending");
  EXPECT_FALSE(evaluator.evaluate(c, {1, 0}));

  oracle.publish(Party{"someone-else"}, "delivery", "confirmed");
  EXPECT_FALSE(evaluator.evaluate(c, {1, 0}));

  oracle.publish(feed_oracle, "delivery", "confirmed");
  EXPECT_TRUE(evaluator.evaluate(c, {1, 0}));

  oracle.clear(feed_oracle, "delivery");
  EXPECT_FALSE(evaluator.evaluate(c, {1, 0}));
}

// -----------------------------------------------------------------------------
// 3. ManualApproval is per escrow and revocable.
// -----------------------------------------------------------------------------
TEST_F(ConditionEvaluatorTest, ManualApprovalIsPerEscrow) {
  Condition c{ManualApprovalCondition{}, notary};

  approvals.approve(notary, 7);
  EXPECT_TRUE(evaluator.evaluate(c, {7, 0}));
  EXPECT_FALSE(evaluator.evaluate(c, {8, 0}));

  approvals.revoke(notary, 7);
  EXPECT_FALSE(evaluator.evaluate(c, {7, 0}));
}

// -----------------------------------------------------------------------------
// 4. No conditions: vacuously met.
// -----------------------------------------------------------------------------
TEST_F(ConditionEvaluatorTest, EmptySequenceIsMet) {
  EXPECT_TRUE(evaluator.evaluateAll({}, {1, 0}));
}

// -----------------------------------------------------------------------------
// 5. AND over mixed kinds.
// -----------------------------------------------------------------------------
TEST_F(ConditionEvaluatorTest, AllMustHold) {
  std::vector<Condition> conditions{
      {TimeBasedCondition{50}, Party{}},
      {ManualApprovalCondition{}, notary},
  };

  EXPECT_FALSE(evaluator.evaluateAll(conditions, {3, 60}));
  approvals.approve(notary, 3);
  EXPECT_TRUE(evaluator.evaluateAll(conditions, {3, 60}));
  EXPECT_FALSE(evaluator.evaluateAll(conditions, {3, 40}));
}

// -----------------------------------------------------------------------------
// 6. Short-circuit: an unmet first condition stops the scan before the
//    oracle is consulted.
// -----------------------------------------------------------------------------
TEST(ConditionEvaluatorShortCircuitTest, StopsAtFirstUnmet) {
  CountingOracle counting;
  ledger::InMemoryApprovalRegistry approvals;
  ledger::ConditionEvaluator evaluator{counting, approvals};

  std::vector<Condition> conditions{
      {TimeBasedCondition{1000}, Party{}},
      {OracleBasedCondition{"feed", "yes"}, Party{"o"}},
  };

  EXPECT_FALSE(evaluator.evaluateAll(conditions, {1, 10}));
  EXPECT_EQ(counting.calls, 0);

  EXPECT_TRUE(evaluator.evaluateAll(conditions, {1, 2000}));
  EXPECT_EQ(counting.calls, 1);
}

// -----------------------------------------------------------------------------
// 7. Evaluation is idempotent for unchanged inputs.
// -----------------------------------------------------------------------------
TEST_F(ConditionEvaluatorTest, RepeatedEvaluationIsStable) {
  std::vector<Condition> conditions{
      {OracleBasedCondition{"price", "high"}, feed_oracle}};
  oracle.publish(feed_oracle, "price", "high");

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(evaluator.evaluateAll(conditions, {2, 0}));
  }
}
