// =============================================================================
// escrow_workflow_test.cpp
// =============================================================================
// Unit tests for EscrowWorkflow.
//
// Validates:
//   - create(): validation errors, expiry must lie in the future, value is
//     locked in custody, condition validators are checked
//   - conditionsMet(): vacuous truth, false after expiry or once terminal
//   - release(): EscrowExpired after expiry, ConditionsNotMet while unmet,
//     Released + reference otherwise
//   - refund(): ConditionsNotMet until expiry has passed
//   - Terminal escrows refuse every later release/refund with
//     EscrowNotFound and never change status again
//   - process(): refund after expiry, release when met, idempotent no-op
//     otherwise
//   - A condition backend calling back into the engine is refused
// =============================================================================

#include "ledger/workflow/escrow_workflow.hpp"

#include "workflow_fixture.hpp"

#include <functional>

using ledger::ContractError;
using ledger::domain::Condition;
using ledger::domain::EscrowStatus;
using ledger::domain::ManualApprovalCondition;
using ledger::domain::OracleBasedCondition;
using ledger::domain::Party;
using ledger::domain::TimeBasedCondition;

class EscrowWorkflowTest : public WorkflowFixture {
 protected:
  ledger::EscrowWorkflow workflow{evaluator};

  const Party notary{"notary"};

  // Active escrow alice → bob, 500, expiring at 2000.
  ledger::domain::EntityId createEscrow(std::vector<Condition> conditions = {}) {
    auto result = workflow.create(ctx, alice, bob, 500, conditions, 2000);
    EXPECT_TRUE(result.ok());
    return result.ok() ? result.value().escrow_id : 0;
  }
};

// -----------------------------------------------------------------------------
// 1. create(): Active record, value moved into custody, event published.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, CreateLocksValue) {
  auto result = workflow.create(ctx, alice, bob, 500, {}, 2000);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().escrow_id, 1u);
  EXPECT_EQ(result.value().status, EscrowStatus::Active);
  EXPECT_FALSE(result.value().confirmation.has_value());

  auto stored = workflow.get(ctx, 1);
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value().created_at, 1000u);
  EXPECT_EQ(stored.value().expires_at, 2000u);

  EXPECT_EQ(str(transfer.balanceOf(ledger::EscrowWorkflow::custodyParty())),
            "500");

  auto published = eventsOf<ledger::EscrowUpdateEvent>();
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0].previous_status, EscrowStatus::Active);
  EXPECT_EQ(published[0].status, EscrowStatus::Active);
}

// -----------------------------------------------------------------------------
// 2. Expiry at or before now is InvalidAmount.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, ExpiryMustBeInFuture) {
  for (ledger::domain::LedgerTime expiry : {999u, 1000u}) {
    auto result = workflow.create(ctx, alice, bob, 500, {}, expiry);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), ContractError::InvalidAmount);
  }
  EXPECT_TRUE(workflow.create(ctx, alice, bob, 500, {}, 1001).ok());
}

// -----------------------------------------------------------------------------
// 3. Amount and address validation.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, CreateValidatesInputs) {
  auto zero = workflow.create(ctx, alice, bob, 0, {}, 2000);
  ASSERT_FALSE(zero.ok());
  EXPECT_EQ(zero.error(), ContractError::InvalidAmount);

  auto overflow = workflow.create(
      ctx, alice, bob, ledger::domain::kAmountHeadroomMax + 1, {}, 2000);
  ASSERT_FALSE(overflow.ok());
  EXPECT_EQ(overflow.error(), ContractError::InvalidAmount);

  auto bad_party = workflow.create(ctx, alice, Party{""}, 10, {}, 2000);
  ASSERT_FALSE(bad_party.ok());
  EXPECT_EQ(bad_party.error(), ContractError::InvalidAddress);

  identity.setAuthorizeAll(false);
  auto unauthorized = workflow.create(ctx, alice, bob, 10, {}, 2000);
  ASSERT_FALSE(unauthorized.ok());
  EXPECT_EQ(unauthorized.error(), ContractError::Unauthorized);

  EXPECT_FALSE(workflow.get(ctx, 1).ok());
}

// -----------------------------------------------------------------------------
// 4. Oracle and approval conditions need a validator; trusted list enforced.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, ConditionValidatorsChecked) {
  auto missing = workflow.create(
      ctx, alice, bob, 10, {Condition{ManualApprovalCondition{}, Party{}}},
      2000);
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error(), ContractError::InvalidAddress);

  EXPECT_TRUE(workflow
                  .create(ctx, alice, bob, 10,
                          {Condition{TimeBasedCondition{1500}, Party{}}}, 2000)
                  .ok());

  ledger::EscrowWorkflow strict{evaluator, {notary}};
  auto untrusted = strict.create(
      ctx, alice, bob, 10,
      {Condition{OracleBasedCondition{"f", "v"}, Party{"rogue"}}}, 2000);
  ASSERT_FALSE(untrusted.ok());
  EXPECT_EQ(untrusted.error(), ContractError::InvalidAddress);

  EXPECT_TRUE(strict
                  .create(ctx, alice, bob, 10,
                          {Condition{ManualApprovalCondition{}, notary}}, 2000)
                  .ok());
}

// -----------------------------------------------------------------------------
// 5. Zero conditions: met at any time before expiry while Active.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, VacuousConditionsMetBeforeExpiry) {
  auto id = createEscrow();

  EXPECT_TRUE(workflow.conditionsMet(ctx, id).value());
  clock.set(2000);
  EXPECT_TRUE(workflow.conditionsMet(ctx, id).value());
  clock.set(2001);
  EXPECT_FALSE(workflow.conditionsMet(ctx, id).value());

  auto unknown = workflow.conditionsMet(ctx, 99);
  ASSERT_FALSE(unknown.ok());
  EXPECT_EQ(unknown.error(), ContractError::EscrowNotFound);
}

// -----------------------------------------------------------------------------
// 6. release(): ConditionsNotMet while unmet, Released once met.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, ReleaseRequiresConditions) {
  auto id = createEscrow({Condition{ManualApprovalCondition{}, notary}});

  auto early = workflow.release(ctx, id);
  ASSERT_FALSE(early.ok());
  EXPECT_EQ(early.error(), ContractError::ConditionsNotMet);
  EXPECT_EQ(workflow.get(ctx, id).value().status, EscrowStatus::Active);

  approvals.approve(notary, id);
  auto released = workflow.release(ctx, id);
  ASSERT_TRUE(released.ok());
  EXPECT_EQ(released.value().status, EscrowStatus::Released);
  EXPECT_EQ(released.value().confirmation, std::string("release/escrow/1"));

  EXPECT_EQ(str(transfer.balanceOf(bob)), "500");
  EXPECT_EQ(str(transfer.balanceOf(ledger::EscrowWorkflow::custodyParty())),
            "0");
  EXPECT_FALSE(guard.held());
}

// -----------------------------------------------------------------------------
// 7. Active escrow: before expiry refund fails, after expiry release fails.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, TemporalRules) {
  auto id = createEscrow();

  clock.set(2000);
  auto refund_early = workflow.refund(ctx, id);
  ASSERT_FALSE(refund_early.ok());
  EXPECT_EQ(refund_early.error(), ContractError::ConditionsNotMet);

  clock.set(2001);
  auto release_late = workflow.release(ctx, id);
  ASSERT_FALSE(release_late.ok());
  EXPECT_EQ(release_late.error(), ContractError::EscrowExpired);

  auto refunded = workflow.refund(ctx, id);
  ASSERT_TRUE(refunded.ok());
  EXPECT_EQ(refunded.value().status, EscrowStatus::Refunded);
  EXPECT_EQ(refunded.value().confirmation, std::string("refund/escrow/1"));
  EXPECT_EQ(str(transfer.balanceOf(alice)), "0");
}

// -----------------------------------------------------------------------------
// 8. Terminal escrows refuse everything and never change again.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, TerminalEscrowIsFinal) {
  auto released_id = createEscrow();
  ASSERT_TRUE(workflow.release(ctx, released_id).ok());

  auto refunded_id = createEscrow();
  clock.set(3000);
  ASSERT_TRUE(workflow.refund(ctx, refunded_id).ok());

  for (auto id : {released_id, refunded_id}) {
    const auto before = workflow.get(ctx, id).value().status;

    auto release = workflow.release(ctx, id);
    ASSERT_FALSE(release.ok());
    EXPECT_EQ(release.error(), ContractError::EscrowNotFound);

    auto refund = workflow.refund(ctx, id);
    ASSERT_FALSE(refund.ok());
    EXPECT_EQ(refund.error(), ContractError::EscrowNotFound);

    auto process = workflow.process(ctx, id);
    ASSERT_FALSE(process.ok());
    EXPECT_EQ(process.error(), ContractError::EscrowNotFound);

    EXPECT_FALSE(workflow.conditionsMet(ctx, id).value());
    EXPECT_EQ(workflow.get(ctx, id).value().status, before);
  }
}

// -----------------------------------------------------------------------------
// 9. process(): no-op while unmet (repeatable), release once met.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, ProcessReleasesWhenMet) {
  const Party oracle_party{"oracle-1"};
  auto id = createEscrow(
      {Condition{OracleBasedCondition{"delivery", "done"}, oracle_party}});
  const auto event_count = events.size();

  for (int i = 0; i < 3; ++i) {
    auto idle = workflow.process(ctx, id);
    ASSERT_TRUE(idle.ok());
    EXPECT_EQ(idle.value().status, EscrowStatus::Active);
    EXPECT_FALSE(idle.value().confirmation.has_value());
  }
  EXPECT_EQ(events.size(), event_count);

  oracle.publish(oracle_party, "delivery", "done");
  auto released = workflow.process(ctx, id);
  ASSERT_TRUE(released.ok());
  EXPECT_EQ(released.value().status, EscrowStatus::Released);
}

// -----------------------------------------------------------------------------
// 10. process() after expiry refunds even if conditions hold.
// -----------------------------------------------------------------------------
TEST_F(EscrowWorkflowTest, ProcessRefundsAfterExpiry) {
  auto id = createEscrow();
  clock.set(2500);

  auto result = workflow.process(ctx, id);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().status, EscrowStatus::Refunded);

  auto published = eventsOf<ledger::EscrowUpdateEvent>();
  ASSERT_EQ(published.size(), 2u);
  EXPECT_EQ(published[1].previous_status, EscrowStatus::Active);
  EXPECT_EQ(published[1].status, EscrowStatus::Refunded);
}

// -----------------------------------------------------------------------------
// 11. A condition backend that calls back into the workflow while release()
//     evaluates it is refused with ReentrancyDetected.
// -----------------------------------------------------------------------------
namespace {

class ReentrantRegistry : public ledger::IApprovalRegistry {
 public:
  std::function<void()> hook;

  bool hasApproved(const Party&, ledger::domain::EntityId) const override {
    if (hook) {
      hook();
    }
    return true;
  }
};

}  // namespace

TEST_F(EscrowWorkflowTest, ReentrantConditionBackendRefused) {
  ReentrantRegistry registry;
  ledger::ConditionEvaluator hooked{oracle, registry};
  ledger::EscrowWorkflow hooked_workflow{hooked};

  auto created = hooked_workflow.create(
      ctx, alice, bob, 10, {Condition{ManualApprovalCondition{}, notary}},
      2000);
  ASSERT_TRUE(created.ok());
  const auto id = created.value().escrow_id;

  std::vector<ContractError> nested;
  registry.hook = [&]() {
    auto r = hooked_workflow.refund(ctx, id);
    if (!r.ok()) {
      nested.push_back(r.error());
    }
  };

  auto released = hooked_workflow.release(ctx, id);
  ASSERT_TRUE(released.ok());
  ASSERT_EQ(nested.size(), 1u);
  EXPECT_EQ(nested[0], ContractError::ReentrancyDetected);
  EXPECT_FALSE(guard.held());
}
