#include "ledger/workflow/transaction_workflow.hpp"

#include "ledger/domain/lifecycle.hpp"

#include <iostream>
#include <stdexcept>

namespace ledger {

namespace {
constexpr const char* kComponent = "TransactionWorkflow";
}  // namespace

// -----------------------------------------------------------------------------
// create()
// -----------------------------------------------------------------------------
Result<domain::TransactionResult> TransactionWorkflow::create(
    InvocationContext& ctx, const domain::Party& sender,
    const domain::Party& recipient, domain::Amount amount,
    const std::string& metadata, domain::TransactionKind kind) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  if (!ctx.identity.isValidParty(sender) ||
      !ctx.identity.isValidParty(recipient)) {
    return rejectWith(kComponent, "create", 0, ContractError::InvalidAddress);
  }
  if (!domain::isValidAmount(amount)) {
    return rejectWith(kComponent, "create", 0, ContractError::InvalidAmount);
  }
  if (!ctx.identity.isAuthorized(sender)) {
    return rejectWith(kComponent, "create", 0, ContractError::Unauthorized);
  }

  domain::Transaction tx;
  tx.id = ctx.ids.next(domain::EntityKind::Transaction);
  tx.kind = kind;
  tx.sender = sender;
  tx.recipient = recipient;
  tx.amount = amount;
  tx.status = domain::TransactionStatus::Pending;
  tx.created_at = ctx.clock.now();
  tx.metadata = metadata;

  ctx.records.saveTransaction(tx);
  ctx.records.appendHistory(sender, tx.id);
  ctx.records.appendHistory(recipient, tx.id);

  TransferRequest request{sender,
                          recipient,
                          amount,
                          metadata,
                          domain::EntityKind::Transaction,
                          tx.id,
                          "transfer"};
  Result<std::string> moved = ctx.transfer.transfer(request);

  const domain::TransactionStatus next =
      moved.ok() ? domain::TransactionStatus::Confirmed
                 : domain::TransactionStatus::Failed;
  if (!domain::canTransition(tx.status, next)) {
    throw std::logic_error(std::string("TransactionWorkflow: illegal transition ") +
                           domain::to_string(tx.status) + " -> " +
                           domain::to_string(next));
  }
  tx.status = next;
  ctx.records.saveTransaction(tx);

  TransactionEvent event;
  event.transaction = tx;
  event.confirmation = moved.ok() ? moved.value() : std::string{};
  event.ledger_time = tx.created_at;
  ctx.publish(event);

  if (!moved.ok()) {
    return rejectWith(kComponent, "settle", tx.id, moved.error());
  }

  std::cout << "[TransactionWorkflow] #" << tx.id << " "
            << domain::to_string(tx.kind) << " " << sender.address << " -> "
            << recipient.address << " " << domain::amountToString(amount)
            << " confirmed\n";

  return domain::TransactionResult{tx.id, tx.status, moved.value()};
}

Result<domain::Transaction> TransactionWorkflow::get(
    InvocationContext& ctx, domain::EntityId id) const {
  auto tx = ctx.records.loadTransaction(id);
  if (!tx) {
    return ContractError::TransactionNotFound;
  }
  return *tx;
}

// -----------------------------------------------------------------------------
// history(): index order is allocation order, so the page is ascending
// -----------------------------------------------------------------------------
Result<std::vector<domain::Transaction>> TransactionWorkflow::history(
    InvocationContext& ctx, const domain::Party& party, std::size_t offset,
    std::size_t limit) const {
  if (!ctx.identity.isValidParty(party)) {
    return ContractError::InvalidAddress;
  }

  const std::vector<domain::EntityId> ids = ctx.records.historyIds(party);

  std::vector<domain::Transaction> page;
  for (std::size_t i = offset; i < ids.size(); ++i) {
    if (limit != 0 && page.size() >= limit) {
      break;
    }
    auto tx = ctx.records.loadTransaction(ids[i]);
    if (!tx) {
      throw std::runtime_error("TransactionWorkflow: index references missing "
                               "transaction " + std::to_string(ids[i]));
    }
    page.push_back(std::move(*tx));
  }
  return page;
}

}  // namespace ledger
