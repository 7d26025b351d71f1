#pragma once

#include "ledger/domain/result.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// ReentrancyGuard
// -----------------------------------------------------------------------------
//
// @brief  Single exclusion flag held for the whole duration of every
//         state-mutating engine operation. A nested call into any mutating
//         operation (from an event subscriber, a condition backend or a
//         value-transfer callback) is refused with ReentrancyDetected.
//
// @details
// One flag for the whole engine, not one per entity: the hazard is logical
// reentry through a collaborator, not concurrent access.
//
// enter() and leave() are the raw protocol. Workflow code uses the RAII
// Scope instead, which pairs them on every exit path:
//
//   ReentrancyGuard::Scope scope(guard);
//   if (!scope.admitted()) return ContractError::ReentrancyDetected;
//
// The guard is an explicit object owned by the engine and passed to every
// workflow through the InvocationContext. It is not persisted.
//
// Thread model: not thread-safe. One invocation at a time.
// -----------------------------------------------------------------------------
class ReentrancyGuard {
 public:
  ReentrancyGuard() = default;

  ReentrancyGuard(const ReentrancyGuard&) = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

  // Sets the flag. Fails with ReentrancyDetected if it is already set.
  Status enter();

  // Clears the flag unconditionally.
  void leave() { held_ = false; }

  bool held() const { return held_; }

  // ---------------------------------------------------------------------------
  // Scope: enter on construction, leave on destruction if admitted
  // ---------------------------------------------------------------------------
  // A Scope that was not admitted leaves the flag untouched, so the outer
  // holder keeps it.
  // ---------------------------------------------------------------------------
  class Scope {
   public:
    explicit Scope(ReentrancyGuard& guard)
        : guard_(guard), admitted_(guard.enter().ok()) {}

    ~Scope() {
      if (admitted_) {
        guard_.leave();
      }
    }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    bool admitted() const { return admitted_; }

   private:
    ReentrancyGuard& guard_;
    bool admitted_;
  };

 private:
  bool held_{false};
};

}  // namespace ledger
