#pragma once

#include "ledger/domain/contract_error.hpp"
#include "ledger/domain/types.hpp"
#include "ledger/eventbus/event_bus.hpp"
#include "ledger/guard/reentrancy_guard.hpp"
#include "ledger/identity/i_identity_verifier.hpp"
#include "ledger/store/id_allocator.hpp"
#include "ledger/store/record_store.hpp"
#include "ledger/store/transactional_store.hpp"
#include "ledger/time/i_ledger_clock.hpp"
#include "ledger/transfer/i_value_transfer.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// InvocationContext
// -----------------------------------------------------------------------------
//
// @brief  Everything a workflow operation touches, passed explicitly into
//         every workflow call. Nothing a workflow uses is global.
//
// @details
//   guard    : the single reentrancy flag for the engine
//   store    : per-invocation write overlay over the durable store
//   records  : typed view over `store`
//   ids      : identifier allocator (writes through to the durable store)
//   clock    : ledger time, read-only for the duration of an operation
//   identity : party validity and authorization checks
//   transfer : value movement backend
//   events   : optional event sink; nullptr disables publication
//
// Ownership:
//   All members are references into objects owned by LedgerEngine (or by a
//   test fixture). The context itself is a cheap aggregate.
// -----------------------------------------------------------------------------
struct InvocationContext {
  ReentrancyGuard& guard;
  TransactionalStore& store;
  RecordStore& records;
  IdAllocator& ids;
  const ILedgerClock& clock;
  const IIdentityVerifier& identity;
  IValueTransfer& transfer;
  EventBus* events{nullptr};

  void publish(const Event& event) const {
    if (events != nullptr) {
      events->publish(event);
    }
  }
};

// -----------------------------------------------------------------------------
// InvocationScope: one mutating operation's guard and write batch
// -----------------------------------------------------------------------------
//
// @brief  RAII wrapper every mutating workflow operation opens first.
//
// @details
// Construction enters the reentrancy guard. If admitted, destruction:
//   1. commits the invocation's buffered writes, or rolls them back when the
//      scope is being unwound by an exception (a host fault), then
//   2. releases the guard.
//
// A ContractError return is a normal exit: writes made before it (an
// invoice flipped to Expired, a Failed transaction) are committed together
// with the error.
//
// A scope that was not admitted touches neither the store nor the guard;
// the outer invocation keeps both.
// -----------------------------------------------------------------------------
class InvocationScope {
 public:
  explicit InvocationScope(InvocationContext& ctx);
  ~InvocationScope();

  InvocationScope(const InvocationScope&) = delete;
  InvocationScope& operator=(const InvocationScope&) = delete;

  bool admitted() const { return guard_scope_.admitted(); }

 private:
  InvocationContext& ctx_;
  int uncaught_on_entry_;
  ReentrancyGuard::Scope guard_scope_;  // Destroyed after ~InvocationScope body
};

// -----------------------------------------------------------------------------
// rejectWith
// -----------------------------------------------------------------------------
// Logs a refused operation as a WARNING line and returns the error, so a
// workflow can write `return rejectWith("EscrowWorkflow", "release", id, e);`
// -----------------------------------------------------------------------------
ContractError rejectWith(const char* component, const char* operation,
                         domain::EntityId id, ContractError error);

}  // namespace ledger
