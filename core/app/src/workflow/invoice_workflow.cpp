#include "ledger/workflow/invoice_workflow.hpp"

#include "ledger/domain/lifecycle.hpp"

#include <iostream>

namespace ledger {

namespace {

constexpr const char* kComponent = "InvoiceWorkflow";

domain::InvoiceResult resultOf(const domain::Invoice& invoice,
                               std::optional<std::string> confirmation = {}) {
  return domain::InvoiceResult{invoice.id, invoice.status,
                               std::move(confirmation)};
}

}  // namespace

// -----------------------------------------------------------------------------
// create()
// -----------------------------------------------------------------------------
Result<domain::InvoiceResult> InvoiceWorkflow::create(
    InvocationContext& ctx, const domain::Party& creator,
    const domain::Party& client, domain::Amount amount,
    const std::string& description, domain::LedgerTime due_date) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  if (!ctx.identity.isValidParty(creator) ||
      !ctx.identity.isValidParty(client)) {
    return rejectWith(kComponent, "create", 0, ContractError::InvalidAddress);
  }
  if (!domain::isValidAmount(amount)) {
    return rejectWith(kComponent, "create", 0, ContractError::InvalidAmount);
  }

  const domain::LedgerTime now = ctx.clock.now();
  if (due_date <= now) {
    return rejectWith(kComponent, "create", 0, ContractError::InvalidAmount);
  }

  domain::Invoice invoice;
  invoice.id = ctx.ids.next(domain::EntityKind::Invoice);
  invoice.creator = creator;
  invoice.client = client;
  invoice.amount = amount;
  invoice.description = description;
  invoice.status = domain::InvoiceStatus::Draft;
  invoice.created_at = now;
  invoice.due_date = due_date;

  ctx.records.saveInvoice(invoice);

  InvoiceUpdateEvent event;
  event.invoice_id = invoice.id;
  event.previous_status = invoice.status;
  event.status = invoice.status;
  event.ledger_time = now;
  ctx.publish(event);

  return resultOf(invoice);
}

Result<domain::InvoiceResult> InvoiceWorkflow::markSent(
    InvocationContext& ctx, domain::EntityId id,
    const domain::Party& creator) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto invoice = ctx.records.loadInvoice(id);
  if (!invoice) {
    return rejectWith(kComponent, "mark_sent", id,
                      ContractError::InvoiceNotFound);
  }
  if (invoice->creator != creator ||
      !domain::canTransition(invoice->status, domain::InvoiceStatus::Sent)) {
    return rejectWith(kComponent, "mark_sent", id, ContractError::Unauthorized);
  }

  transition(ctx, *invoice, domain::InvoiceStatus::Sent);
  return resultOf(*invoice);
}

// -----------------------------------------------------------------------------
// approve()
// -----------------------------------------------------------------------------
Result<domain::InvoiceResult> InvoiceWorkflow::approve(
    InvocationContext& ctx, domain::EntityId id, const domain::Party& client) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto invoice = ctx.records.loadInvoice(id);
  if (!invoice) {
    return rejectWith(kComponent, "approve", id,
                      ContractError::InvoiceNotFound);
  }
  if (!ctx.identity.isAuthorized(client)) {
    return rejectWith(kComponent, "approve", id, ContractError::Unauthorized);
  }
  if (invoice->client != client) {
    return rejectWith(kComponent, "approve", id, ContractError::Unauthorized);
  }
  if (!domain::canTransition(invoice->status,
                             domain::InvoiceStatus::Approved)) {
    return rejectWith(kComponent, "approve", id,
                      ContractError::InvoiceAlreadyApproved);
  }

  const domain::LedgerTime now = ctx.clock.now();
  if (now > invoice->due_date) {
    transition(ctx, *invoice, domain::InvoiceStatus::Expired);
    return rejectWith(kComponent, "approve", id,
                      ContractError::InvoiceExpired);
  }

  invoice->approved_at = now;
  transition(ctx, *invoice, domain::InvoiceStatus::Approved);
  return resultOf(*invoice);
}

// -----------------------------------------------------------------------------
// execute(): pays creator from client
// -----------------------------------------------------------------------------
Result<domain::InvoiceResult> InvoiceWorkflow::execute(InvocationContext& ctx,
                                                       domain::EntityId id) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto invoice = ctx.records.loadInvoice(id);
  if (!invoice) {
    return rejectWith(kComponent, "execute", id,
                      ContractError::InvoiceNotFound);
  }
  if (!domain::canTransition(invoice->status,
                             domain::InvoiceStatus::Executed)) {
    return rejectWith(kComponent, "execute", id, ContractError::Unauthorized);
  }

  if (ctx.clock.now() > invoice->due_date) {
    transition(ctx, *invoice, domain::InvoiceStatus::Expired);
    return rejectWith(kComponent, "execute", id,
                      ContractError::InvoiceExpired);
  }

  if (!ctx.identity.isAuthorized(invoice->client)) {
    return rejectWith(kComponent, "execute", id, ContractError::Unauthorized);
  }

  Result<std::string> paid = ctx.transfer.transfer(TransferRequest{
      invoice->client, invoice->creator, invoice->amount, invoice->description,
      domain::EntityKind::Invoice, invoice->id, "payment"});
  if (!paid.ok()) {
    return rejectWith(kComponent, "execute", id, paid.error());
  }

  transition(ctx, *invoice, domain::InvoiceStatus::Executed, paid.value());
  return resultOf(*invoice, paid.value());
}

Result<domain::InvoiceResult> InvoiceWorkflow::reject(
    InvocationContext& ctx, domain::EntityId id, const domain::Party& client,
    const std::string& reason) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto invoice = ctx.records.loadInvoice(id);
  if (!invoice) {
    return rejectWith(kComponent, "reject", id,
                      ContractError::InvoiceNotFound);
  }
  if (!ctx.identity.isAuthorized(client)) {
    return rejectWith(kComponent, "reject", id, ContractError::Unauthorized);
  }
  if (invoice->client != client ||
      !domain::canTransition(invoice->status,
                             domain::InvoiceStatus::Rejected)) {
    return rejectWith(kComponent, "reject", id, ContractError::Unauthorized);
  }

  invoice->rejection_reason = reason;
  transition(ctx, *invoice, domain::InvoiceStatus::Rejected);
  return resultOf(*invoice);
}

// -----------------------------------------------------------------------------
// checkExpiration(): only Sent and Approved invoices expire here
// -----------------------------------------------------------------------------
Result<domain::InvoiceResult> InvoiceWorkflow::checkExpiration(
    InvocationContext& ctx, domain::EntityId id) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto invoice = ctx.records.loadInvoice(id);
  if (!invoice) {
    return ContractError::InvoiceNotFound;
  }

  const bool can_expire = invoice->status == domain::InvoiceStatus::Sent ||
                          invoice->status == domain::InvoiceStatus::Approved;
  if (can_expire && ctx.clock.now() > invoice->due_date) {
    transition(ctx, *invoice, domain::InvoiceStatus::Expired);
  }
  return resultOf(*invoice);
}

Result<domain::Invoice> InvoiceWorkflow::get(InvocationContext& ctx,
                                             domain::EntityId id) const {
  auto invoice = ctx.records.loadInvoice(id);
  if (!invoice) {
    return ContractError::InvoiceNotFound;
  }
  return *invoice;
}

void InvoiceWorkflow::transition(
    InvocationContext& ctx, domain::Invoice& invoice,
    domain::InvoiceStatus next,
    const std::optional<std::string>& confirmation) {
  const domain::InvoiceStatus previous = invoice.status;
  invoice.status = next;
  ctx.records.saveInvoice(invoice);

  InvoiceUpdateEvent event;
  event.invoice_id = invoice.id;
  event.previous_status = previous;
  event.status = next;
  event.confirmation = confirmation;
  event.reason = invoice.rejection_reason;
  event.ledger_time = ctx.clock.now();
  ctx.publish(event);

  std::cout << "[InvoiceWorkflow] #" << invoice.id << " "
            << domain::to_string(previous) << " -> " << domain::to_string(next)
            << "\n";
}

}  // namespace ledger
