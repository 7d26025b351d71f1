#pragma once

#include "ledger/domain/types.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// ILedgerClock: abstract ledger time source
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface for "current ledger time", in seconds.
//
// @details
// Every temporal rule in the workflows (escrow expiry, invoice due dates,
// TimeBased conditions, approval stamps) compares against now(). None of
// them touch std::chrono directly: under replay the host dictates what
// "now" is, and two replicas executing the same invocation must read the
// same value.
//
// Implementations:
//   - SimulationLedgerClock → value set by the host or the replay driver.
//   - SystemLedgerClock     → wall clock, for interactive use.
//
// Contract:
//   now() is read-only and must not change during a single invocation. The
//   host advances it only between operations.
//
// Ownership:
//   Components hold a const reference; they do NOT own the clock.
// -----------------------------------------------------------------------------
class ILedgerClock {
 public:
  virtual ~ILedgerClock() = default;

  // -------------------------------------------------------------------------
  // now()
  // -------------------------------------------------------------------------
  // @brief  Returns the current ledger timestamp in seconds since the Unix
  //         epoch.
  //
  // Side-effects: None.
  // -------------------------------------------------------------------------
  virtual domain::LedgerTime now() const = 0;
};

}  // namespace ledger
