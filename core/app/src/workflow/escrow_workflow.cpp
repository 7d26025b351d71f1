#include "ledger/workflow/escrow_workflow.hpp"

#include "ledger/domain/lifecycle.hpp"

#include <iostream>
#include <stdexcept>

namespace ledger {

namespace {
constexpr const char* kComponent = "EscrowWorkflow";
}  // namespace

EscrowWorkflow::EscrowWorkflow(const ConditionEvaluator& evaluator,
                               std::set<domain::Party> trusted_validators)
    : evaluator_(evaluator),
      trusted_validators_(std::move(trusted_validators)) {}

const domain::Party& EscrowWorkflow::custodyParty() {
  static const domain::Party kCustody{"escrow-custody"};
  return kCustody;
}

// -----------------------------------------------------------------------------
// create()
// -----------------------------------------------------------------------------
Result<domain::EscrowResult> EscrowWorkflow::create(
    InvocationContext& ctx, const domain::Party& sender,
    const domain::Party& recipient, domain::Amount amount,
    const std::vector<domain::Condition>& conditions,
    domain::LedgerTime expires_at) {
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
  Status valid = validateConditions(ctx, conditions);
  if (!valid.ok()) {
    return rejectWith(kComponent, "create", 0, valid.error());
  }
  if (!ctx.identity.isAuthorized(sender)) {
    return rejectWith(kComponent, "create", 0, ContractError::Unauthorized);
  }

  const domain::LedgerTime now = ctx.clock.now();
  if (expires_at <= now) {
    return rejectWith(kComponent, "create", 0, ContractError::InvalidAmount);
  }

  domain::Escrow escrow;
  escrow.id = ctx.ids.next(domain::EntityKind::Escrow);
  escrow.sender = sender;
  escrow.recipient = recipient;
  escrow.amount = amount;
  escrow.conditions = conditions;
  escrow.status = domain::EscrowStatus::Active;
  escrow.created_at = now;
  escrow.expires_at = expires_at;

  Result<std::string> locked = ctx.transfer.transfer(TransferRequest{
      sender, custodyParty(), amount, "escrow lock",
      domain::EntityKind::Escrow, escrow.id, "lock"});
  if (!locked.ok()) {
    return rejectWith(kComponent, "lock", escrow.id, locked.error());
  }

  ctx.records.saveEscrow(escrow);

  EscrowUpdateEvent event;
  event.escrow_id = escrow.id;
  event.previous_status = escrow.status;
  event.status = escrow.status;
  event.confirmation = locked.value();
  event.ledger_time = now;
  ctx.publish(event);

  std::cout << "[EscrowWorkflow] #" << escrow.id << " active, "
            << escrow.conditions.size() << " condition(s), expires at "
            << expires_at << "\n";

  return domain::EscrowResult{escrow.id, escrow.status, std::nullopt};
}

// -----------------------------------------------------------------------------
// conditionsMet(): read-only, no guard
// -----------------------------------------------------------------------------
Result<bool> EscrowWorkflow::conditionsMet(InvocationContext& ctx,
                                           domain::EntityId id) const {
  auto escrow = ctx.records.loadEscrow(id);
  if (!escrow) {
    return ContractError::EscrowNotFound;
  }
  if (escrow->status != domain::EscrowStatus::Active ||
      ctx.clock.now() > escrow->expires_at) {
    return false;
  }
  return conditionsHold(ctx, *escrow);
}

Result<domain::EscrowResult> EscrowWorkflow::release(InvocationContext& ctx,
                                                     domain::EntityId id) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto escrow = loadActive(ctx, id, "release");
  if (!escrow.ok()) {
    return escrow.error();
  }
  return releaseLocked(ctx, std::move(escrow).value());
}

Result<domain::EscrowResult> EscrowWorkflow::refund(InvocationContext& ctx,
                                                    domain::EntityId id) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto escrow = loadActive(ctx, id, "refund");
  if (!escrow.ok()) {
    return escrow.error();
  }
  return refundLocked(ctx, std::move(escrow).value());
}

// -----------------------------------------------------------------------------
// process(): expiry first, then conditions, else unchanged
// -----------------------------------------------------------------------------
Result<domain::EscrowResult> EscrowWorkflow::process(InvocationContext& ctx,
                                                     domain::EntityId id) {
  InvocationScope scope(ctx);
  if (!scope.admitted()) {
    return ContractError::ReentrancyDetected;
  }

  auto loaded = loadActive(ctx, id, "process");
  if (!loaded.ok()) {
    return loaded.error();
  }
  domain::Escrow escrow = std::move(loaded).value();

  if (ctx.clock.now() > escrow.expires_at) {
    return refundLocked(ctx, std::move(escrow));
  }
  if (conditionsHold(ctx, escrow)) {
    return releaseLocked(ctx, std::move(escrow));
  }

  return domain::EscrowResult{escrow.id, escrow.status, std::nullopt};
}

Result<domain::Escrow> EscrowWorkflow::get(InvocationContext& ctx,
                                           domain::EntityId id) const {
  auto escrow = ctx.records.loadEscrow(id);
  if (!escrow) {
    return ContractError::EscrowNotFound;
  }
  return *escrow;
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------
Status EscrowWorkflow::validateConditions(
    InvocationContext& ctx,
    const std::vector<domain::Condition>& conditions) const {
  for (const auto& condition : conditions) {
    const bool needs_validator =
        condition.kind() != domain::ConditionKind::TimeBased;

    if (condition.validator.empty()) {
      if (needs_validator) {
        return ContractError::InvalidAddress;
      }
      continue;
    }
    if (!ctx.identity.isValidParty(condition.validator)) {
      return ContractError::InvalidAddress;
    }
    if (!trusted_validators_.empty() &&
        trusted_validators_.count(condition.validator) == 0) {
      return ContractError::InvalidAddress;
    }
  }
  return okStatus();
}

bool EscrowWorkflow::conditionsHold(InvocationContext& ctx,
                                    const domain::Escrow& escrow) const {
  return evaluator_.evaluateAll(escrow.conditions,
                                EvaluationContext{escrow.id, ctx.clock.now()});
}

Result<domain::Escrow> EscrowWorkflow::loadActive(InvocationContext& ctx,
                                                  domain::EntityId id,
                                                  const char* operation) const {
  auto escrow = ctx.records.loadEscrow(id);
  if (!escrow || domain::isTerminal(escrow->status)) {
    return rejectWith(kComponent, operation, id,
                      ContractError::EscrowNotFound);
  }
  return *escrow;
}

Result<domain::EscrowResult> EscrowWorkflow::releaseLocked(
    InvocationContext& ctx, domain::Escrow escrow) {
  if (ctx.clock.now() > escrow.expires_at) {
    return rejectWith(kComponent, "release", escrow.id,
                      ContractError::EscrowExpired);
  }
  if (!conditionsHold(ctx, escrow)) {
    return rejectWith(kComponent, "release", escrow.id,
                      ContractError::ConditionsNotMet);
  }

  Result<std::string> moved = ctx.transfer.transfer(TransferRequest{
      custodyParty(), escrow.recipient, escrow.amount, "escrow release",
      domain::EntityKind::Escrow, escrow.id, "release"});
  if (!moved.ok()) {
    return rejectWith(kComponent, "release", escrow.id, moved.error());
  }

  settle(ctx, escrow, domain::EscrowStatus::Released, moved.value());
  return domain::EscrowResult{escrow.id, escrow.status, moved.value()};
}

Result<domain::EscrowResult> EscrowWorkflow::refundLocked(
    InvocationContext& ctx, domain::Escrow escrow) {
  if (ctx.clock.now() <= escrow.expires_at) {
    return rejectWith(kComponent, "refund", escrow.id,
                      ContractError::ConditionsNotMet);
  }

  Result<std::string> moved = ctx.transfer.transfer(TransferRequest{
      custodyParty(), escrow.sender, escrow.amount, "escrow refund",
      domain::EntityKind::Escrow, escrow.id, "refund"});
  if (!moved.ok()) {
    return rejectWith(kComponent, "refund", escrow.id, moved.error());
  }

  settle(ctx, escrow, domain::EscrowStatus::Refunded, moved.value());
  return domain::EscrowResult{escrow.id, escrow.status, moved.value()};
}

void EscrowWorkflow::settle(InvocationContext& ctx, domain::Escrow& escrow,
                            domain::EscrowStatus next,
                            const std::string& reference) {
  const domain::EscrowStatus previous = escrow.status;
  // Value has already moved; an illegal edge aborts the whole invocation.
  if (!domain::canTransition(previous, next)) {
    throw std::logic_error(std::string("EscrowWorkflow: illegal transition ") +
                           domain::to_string(previous) + " -> " +
                           domain::to_string(next));
  }
  escrow.status = next;
  ctx.records.saveEscrow(escrow);

  EscrowUpdateEvent event;
  event.escrow_id = escrow.id;
  event.previous_status = previous;
  event.status = next;
  event.confirmation = reference;
  event.ledger_time = ctx.clock.now();
  ctx.publish(event);

  std::cout << "[EscrowWorkflow] #" << escrow.id << " "
            << domain::to_string(previous) << " -> " << domain::to_string(next)
            << " (" << reference << ")\n";
}

}  // namespace ledger
