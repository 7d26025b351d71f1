// =============================================================================
// creation_amount_test.cpp
// =============================================================================
// Amount validation shared by every creation path.
//
// Validates:
//   - Zero, negative and above-headroom amounts are InvalidAmount on
//     transaction, P2P transaction, escrow and invoice creation alike
//   - A refused creation allocates no id, publishes nothing, moves no value
//     and leaves the guard clear
// =============================================================================

#include "ledger/workflow/escrow_workflow.hpp"
#include "ledger/workflow/invoice_workflow.hpp"
#include "ledger/workflow/transaction_workflow.hpp"

#include "workflow_fixture.hpp"

#include <ostream>
#include <string>

using ledger::ContractError;
using ledger::domain::Amount;
using ledger::domain::EntityKind;
using ledger::domain::TransactionKind;

namespace {

struct InvalidAmountCase {
  const char* name;
  Amount amount;
};

// Keeps gtest from printing the 128-bit amount as raw bytes.
void PrintTo(const InvalidAmountCase& c, std::ostream* os) { *os << c.name; }

}  // namespace

class CreationAmountTest
    : public WorkflowFixture,
      public ::testing::WithParamInterface<InvalidAmountCase> {
 protected:
  ledger::TransactionWorkflow transactions;
  ledger::EscrowWorkflow escrows{evaluator};
  ledger::InvoiceWorkflow invoices;

  void expectNothingCreated() {
    EXPECT_EQ(ids.current(EntityKind::Transaction), 0u);
    EXPECT_EQ(ids.current(EntityKind::Escrow), 0u);
    EXPECT_EQ(ids.current(EntityKind::Invoice), 0u);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(str(transfer.balanceOf(alice)), "0");
    EXPECT_FALSE(guard.held());
  }
};

// -----------------------------------------------------------------------------
// 1. Basic transaction.
// -----------------------------------------------------------------------------
TEST_P(CreationAmountTest, TransactionRefused) {
  auto result = transactions.create(ctx, alice, bob, GetParam().amount, "",
                                    TransactionKind::Basic);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ContractError::InvalidAmount);
  expectNothingCreated();
}

// -----------------------------------------------------------------------------
// 2. P2P transaction.
// -----------------------------------------------------------------------------
TEST_P(CreationAmountTest, P2PTransactionRefused) {
  auto result = transactions.create(ctx, alice, bob, GetParam().amount, "memo",
                                    TransactionKind::P2P);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ContractError::InvalidAmount);
  expectNothingCreated();
}

// -----------------------------------------------------------------------------
// 3. Escrow.
// -----------------------------------------------------------------------------
TEST_P(CreationAmountTest, EscrowRefused) {
  auto result = escrows.create(ctx, alice, bob, GetParam().amount, {}, 2000);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ContractError::InvalidAmount);
  expectNothingCreated();
}

// -----------------------------------------------------------------------------
// 4. Invoice.
// -----------------------------------------------------------------------------
TEST_P(CreationAmountTest, InvoiceRefused) {
  auto result =
      invoices.create(ctx, alice, bob, GetParam().amount, "work", 5000);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ContractError::InvalidAmount);
  expectNothingCreated();
}

INSTANTIATE_TEST_SUITE_P(
    InvalidAmounts, CreationAmountTest,
    ::testing::Values(
        InvalidAmountCase{"Zero", Amount{0}},
        InvalidAmountCase{"Negative", Amount{-1}},
        InvalidAmountCase{"AboveHeadroom",
                          ledger::domain::kAmountHeadroomMax + 1}),
    [](const ::testing::TestParamInfo<InvalidAmountCase>& info) {
      return std::string(info.param.name);
    });
