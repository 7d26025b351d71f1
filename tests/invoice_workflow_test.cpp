// =============================================================================
// invoice_workflow_test.cpp
// =============================================================================
// Unit tests for InvoiceWorkflow.
//
// Validates:
//   - create → mark_sent → approve → execute ends Executed with a payment
//     reference and the approval timestamp retained
//   - Due date must lie in the future at creation
//   - mark_sent: only the creator, only from Draft
//   - approve: check order Unauthorized (unsigned, then wrong client) →
//     InvoiceAlreadyApproved → InvoiceExpired; a late approve persists
//     Expired (from Draft as well as Sent)
//   - execute: only Approved; late execute persists Expired
//   - reject: only the client, only from Draft/Sent; reason stored
//   - check_expiration: only Sent/Approved expire; repeatable
// =============================================================================

#include "ledger/workflow/invoice_workflow.hpp"

#include "workflow_fixture.hpp"

using ledger::ContractError;
using ledger::domain::InvoiceStatus;
using ledger::domain::Party;

class InvoiceWorkflowTest : public WorkflowFixture {
 protected:
  ledger::InvoiceWorkflow workflow;

  const Party& creator = alice;
  const Party& client = bob;

  // Draft invoice alice → bob, 750, due at 5000.
  ledger::domain::EntityId createDraft() {
    auto result = workflow.create(ctx, creator, client, 750, "design work", 5000);
    EXPECT_TRUE(result.ok());
    return result.ok() ? result.value().invoice_id : 0;
  }

  ledger::domain::EntityId createSent() {
    auto id = createDraft();
    EXPECT_TRUE(workflow.markSent(ctx, id, creator).ok());
    return id;
  }

  InvoiceStatus statusOf(ledger::domain::EntityId id) {
    return workflow.get(ctx, id).value().status;
  }
};

// -----------------------------------------------------------------------------
// 1. Full happy path.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, FullLifecycleExecutes) {
  auto id = createSent();

  clock.set(1500);
  auto approved = workflow.approve(ctx, id, client);
  ASSERT_TRUE(approved.ok());
  EXPECT_EQ(approved.value().status, InvoiceStatus::Approved);

  clock.set(1600);
  auto executed = workflow.execute(ctx, id);
  ASSERT_TRUE(executed.ok());
  EXPECT_EQ(executed.value().status, InvoiceStatus::Executed);
  ASSERT_TRUE(executed.value().confirmation.has_value());
  EXPECT_EQ(*executed.value().confirmation, "payment/invoice/1");

  auto stored = workflow.get(ctx, id);
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value().status, InvoiceStatus::Executed);
  ASSERT_TRUE(stored.value().approved_at.has_value());
  EXPECT_EQ(*stored.value().approved_at, 1500u);

  EXPECT_EQ(str(transfer.balanceOf(creator)), "750");

  auto published = eventsOf<ledger::InvoiceUpdateEvent>();
  ASSERT_EQ(published.size(), 4u);
  EXPECT_EQ(published[3].previous_status, InvoiceStatus::Approved);
  EXPECT_EQ(published[3].status, InvoiceStatus::Executed);
  EXPECT_FALSE(guard.held());
}

// -----------------------------------------------------------------------------
// 2. Creation validation.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, CreateValidatesInputs) {
  auto past_due = workflow.create(ctx, creator, client, 10, "", 1000);
  ASSERT_FALSE(past_due.ok());
  EXPECT_EQ(past_due.error(), ContractError::InvalidAmount);

  auto zero = workflow.create(ctx, creator, client, 0, "", 5000);
  ASSERT_FALSE(zero.ok());
  EXPECT_EQ(zero.error(), ContractError::InvalidAmount);

  auto negative = workflow.create(ctx, creator, client, -1, "", 5000);
  ASSERT_FALSE(negative.ok());
  EXPECT_EQ(negative.error(), ContractError::InvalidAmount);

  auto bad_client = workflow.create(ctx, creator, Party{"a b"}, 10, "", 5000);
  ASSERT_FALSE(bad_client.ok());
  EXPECT_EQ(bad_client.error(), ContractError::InvalidAddress);

  auto created = workflow.create(ctx, creator, client, 10, "", 5000);
  ASSERT_TRUE(created.ok());
  EXPECT_EQ(created.value().status, InvoiceStatus::Draft);
  EXPECT_FALSE(workflow.get(ctx, created.value().invoice_id)
                   .value()
                   .approved_at.has_value());
}

// -----------------------------------------------------------------------------
// 3. mark_sent: wrong creator, wrong status, unknown id.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, MarkSentRules) {
  auto id = createDraft();

  auto wrong_creator = workflow.markSent(ctx, id, client);
  ASSERT_FALSE(wrong_creator.ok());
  EXPECT_EQ(wrong_creator.error(), ContractError::Unauthorized);

  ASSERT_TRUE(workflow.markSent(ctx, id, creator).ok());
  EXPECT_EQ(statusOf(id), InvoiceStatus::Sent);

  auto again = workflow.markSent(ctx, id, creator);
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error(), ContractError::Unauthorized);

  auto unknown = workflow.markSent(ctx, 77, creator);
  ASSERT_FALSE(unknown.ok());
  EXPECT_EQ(unknown.error(), ContractError::InvoiceNotFound);
}

// -----------------------------------------------------------------------------
// 4. approve(): error order.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, ApproveCheckOrder) {
  auto id = createSent();

  identity.setAuthorizeAll(false);
  auto unsigned_call = workflow.approve(ctx, id, client);
  ASSERT_FALSE(unsigned_call.ok());
  EXPECT_EQ(unsigned_call.error(), ContractError::Unauthorized);
  EXPECT_EQ(workflow.get(ctx, id).value().status, InvoiceStatus::Sent);

  identity.setAuthorizeAll(true);
  auto wrong_client = workflow.approve(ctx, id, Party{"mallory"});
  ASSERT_FALSE(wrong_client.ok());
  EXPECT_EQ(wrong_client.error(), ContractError::Unauthorized);

  ASSERT_TRUE(workflow.approve(ctx, id, client).ok());

  auto twice = workflow.approve(ctx, id, client);
  ASSERT_FALSE(twice.ok());
  EXPECT_EQ(twice.error(), ContractError::InvoiceAlreadyApproved);

  auto unknown = workflow.approve(ctx, 99, client);
  ASSERT_FALSE(unknown.ok());
  EXPECT_EQ(unknown.error(), ContractError::InvoiceNotFound);
}

// -----------------------------------------------------------------------------
// 5. A Draft invoice may be approved directly.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, ApproveFromDraft) {
  auto id = createDraft();
  ASSERT_TRUE(workflow.approve(ctx, id, client).ok());
  EXPECT_EQ(statusOf(id), InvoiceStatus::Approved);
}

// -----------------------------------------------------------------------------
// 6. Late approve persists Expired and reports InvoiceExpired, for Sent
//    and Draft invoices alike.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, LateApproveExpires) {
  auto sent = createSent();
  auto draft = createDraft();
  clock.set(5001);

  for (auto id : {sent, draft}) {
    auto result = workflow.approve(ctx, id, client);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), ContractError::InvoiceExpired);
    EXPECT_EQ(statusOf(id), InvoiceStatus::Expired);
    EXPECT_FALSE(workflow.get(ctx, id).value().approved_at.has_value());
  }

  auto after = workflow.approve(ctx, sent, client);
  ASSERT_FALSE(after.ok());
  EXPECT_EQ(after.error(), ContractError::InvoiceAlreadyApproved);
  EXPECT_FALSE(guard.held());
}

// -----------------------------------------------------------------------------
// 7. Due date itself is still in time.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, ApproveOnDueDateSucceeds) {
  auto id = createSent();
  clock.set(5000);
  EXPECT_TRUE(workflow.approve(ctx, id, client).ok());
}

// -----------------------------------------------------------------------------
// 8. execute(): only Approved; late execute expires; approval kept.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, ExecuteRules) {
  auto id = createSent();

  auto not_approved = workflow.execute(ctx, id);
  ASSERT_FALSE(not_approved.ok());
  EXPECT_EQ(not_approved.error(), ContractError::Unauthorized);

  ASSERT_TRUE(workflow.approve(ctx, id, client).ok());
  clock.set(6000);

  auto late = workflow.execute(ctx, id);
  ASSERT_FALSE(late.ok());
  EXPECT_EQ(late.error(), ContractError::InvoiceExpired);

  auto stored = workflow.get(ctx, id).value();
  EXPECT_EQ(stored.status, InvoiceStatus::Expired);
  ASSERT_TRUE(stored.approved_at.has_value());
  EXPECT_EQ(*stored.approved_at, 1000u);
  EXPECT_EQ(str(transfer.balanceOf(creator)), "0");
}

// -----------------------------------------------------------------------------
// 9. execute() surfaces a refused payment and leaves the invoice Approved.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, ExecuteWithInsufficientBalance) {
  auto id = createSent();
  ASSERT_TRUE(workflow.approve(ctx, id, client).ok());

  transfer.setEnforceBalances(true);
  auto refused = workflow.execute(ctx, id);
  ASSERT_FALSE(refused.ok());
  EXPECT_EQ(refused.error(), ContractError::InsufficientBalance);
  EXPECT_EQ(statusOf(id), InvoiceStatus::Approved);

  transfer.credit(client, 750);
  EXPECT_TRUE(workflow.execute(ctx, id).ok());
}

// -----------------------------------------------------------------------------
// 10. execute() requires the client to authorize the payment.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, ExecuteRequiresClientAuthorization) {
  auto id = createSent();
  ASSERT_TRUE(workflow.approve(ctx, id, client).ok());

  identity.setAuthorizeAll(false);
  auto result = workflow.execute(ctx, id);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ContractError::Unauthorized);
  EXPECT_EQ(statusOf(id), InvoiceStatus::Approved);
}

// -----------------------------------------------------------------------------
// 11. reject(): client only, Draft/Sent only, reason stored and published.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, RejectRules) {
  auto id = createSent();

  auto wrong_client = workflow.reject(ctx, id, creator, "no");
  ASSERT_FALSE(wrong_client.ok());
  EXPECT_EQ(wrong_client.error(), ContractError::Unauthorized);

  identity.setAuthorizeAll(false);
  auto unsigned_call = workflow.reject(ctx, id, client, "no");
  ASSERT_FALSE(unsigned_call.ok());
  EXPECT_EQ(unsigned_call.error(), ContractError::Unauthorized);
  identity.setAuthorizeAll(true);

  auto rejected = workflow.reject(ctx, id, client, "scope changed");
  ASSERT_TRUE(rejected.ok());
  EXPECT_EQ(rejected.value().status, InvoiceStatus::Rejected);

  auto stored = workflow.get(ctx, id).value();
  ASSERT_TRUE(stored.rejection_reason.has_value());
  EXPECT_EQ(*stored.rejection_reason, "scope changed");

  auto published = eventsOf<ledger::InvoiceUpdateEvent>();
  ASSERT_FALSE(published.empty());
  ASSERT_TRUE(published.back().reason.has_value());
  EXPECT_EQ(*published.back().reason, "scope changed");

  auto approved_id = createSent();
  ASSERT_TRUE(workflow.approve(ctx, approved_id, client).ok());
  auto too_late = workflow.reject(ctx, approved_id, client, "changed mind");
  ASSERT_FALSE(too_late.ok());
  EXPECT_EQ(too_late.error(), ContractError::Unauthorized);
}

// -----------------------------------------------------------------------------
// 12. check_expiration(): Draft never expires here; Sent/Approved do;
//     repeating is harmless.
// -----------------------------------------------------------------------------
TEST_F(InvoiceWorkflowTest, CheckExpiration) {
  auto draft = createDraft();
  auto sent = createSent();
  auto approved = createSent();
  ASSERT_TRUE(workflow.approve(ctx, approved, client).ok());

  auto before = workflow.checkExpiration(ctx, sent);
  ASSERT_TRUE(before.ok());
  EXPECT_EQ(before.value().status, InvoiceStatus::Sent);

  clock.set(5001);
  EXPECT_EQ(workflow.checkExpiration(ctx, draft).value().status,
            InvoiceStatus::Draft);
  EXPECT_EQ(workflow.checkExpiration(ctx, sent).value().status,
            InvoiceStatus::Expired);
  EXPECT_EQ(workflow.checkExpiration(ctx, approved).value().status,
            InvoiceStatus::Expired);

  const auto event_count = events.size();
  EXPECT_EQ(workflow.checkExpiration(ctx, sent).value().status,
            InvoiceStatus::Expired);
  EXPECT_EQ(events.size(), event_count);

  auto unknown = workflow.checkExpiration(ctx, 404);
  ASSERT_FALSE(unknown.ok());
  EXPECT_EQ(unknown.error(), ContractError::InvoiceNotFound);
}
