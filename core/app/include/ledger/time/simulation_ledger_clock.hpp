#pragma once

#include "ledger/time/i_ledger_clock.hpp"

#include <atomic>

namespace ledger {

// -----------------------------------------------------------------------------
// SimulationLedgerClock: externally driven ledger clock
// -----------------------------------------------------------------------------
//
// @brief  ILedgerClock whose value is set explicitly by whoever drives the
//         engine: the host ledger, the replay driver, or a test.
//
// @details
// This is the clock that makes executions reproducible: identical scripts
// produce identical timestamps, identical expiry decisions, and identical
// records across runs.
//
// Storage is an std::atomic so a host thread may advance the clock while a
// monitoring thread reads it. The engine itself only reads.
//
// Monotonicity:
//   advance_to() refuses to move the clock backwards and returns false in
//   that case; set() is unconditional and exists for tests that need to
//   rewind.
// -----------------------------------------------------------------------------
class SimulationLedgerClock final : public ILedgerClock {
 public:
  SimulationLedgerClock() = default;
  explicit SimulationLedgerClock(domain::LedgerTime start) : now_(start) {}

  domain::LedgerTime now() const override;

  // -------------------------------------------------------------------------
  // advance_to(t)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward to t.
  //
  // @return true if the clock now reads t; false if t is earlier than the
  //         current reading (the clock is left unchanged).
  // -------------------------------------------------------------------------
  bool advance_to(domain::LedgerTime t);

  // Moves the clock forward by `seconds`.
  void advance_by(domain::LedgerTime seconds);

  // Unconditional set, including backwards. Test use.
  void set(domain::LedgerTime t);

 private:
  std::atomic<domain::LedgerTime> now_{0};
};

}  // namespace ledger
