#include "ledger/workflow/invocation_context.hpp"

#include <exception>
#include <iostream>

namespace ledger {

InvocationScope::InvocationScope(InvocationContext& ctx)
    : ctx_(ctx),
      uncaught_on_entry_(std::uncaught_exceptions()),
      guard_scope_(ctx.guard) {}

// -----------------------------------------------------------------------------
// ~InvocationScope(): settle the write batch while the guard is still held
// -----------------------------------------------------------------------------
InvocationScope::~InvocationScope() {
  if (!guard_scope_.admitted()) {
    return;
  }

  if (std::uncaught_exceptions() > uncaught_on_entry_) {
    std::cerr << "[InvocationScope] WARNING: host fault, discarding "
              << ctx_.store.pendingCount() << " pending writes\n";
    ctx_.store.rollback();
  } else {
    ctx_.store.commit();
  }
}

ContractError rejectWith(const char* component, const char* operation,
                         domain::EntityId id, ContractError error) {
  std::cerr << "[" << component << "] WARNING: " << operation << " #" << id
            << " refused: " << to_string(error) << "\n";
  return error;
}

}  // namespace ledger
