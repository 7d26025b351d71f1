#include "ledger/time/simulation_ledger_clock.hpp"

namespace ledger {

domain::LedgerTime SimulationLedgerClock::now() const { return now_.load(); }

// -----------------------------------------------------------------------------
// advance_to(): compare-exchange loop so a concurrent reader never observes
// the clock moving backwards
// -----------------------------------------------------------------------------
bool SimulationLedgerClock::advance_to(domain::LedgerTime t) {
  domain::LedgerTime current = now_.load();
  while (current <= t) {
    if (now_.compare_exchange_weak(current, t)) {
      return true;
    }
  }
  return false;
}

void SimulationLedgerClock::advance_by(domain::LedgerTime seconds) {
  now_.fetch_add(seconds);
}

void SimulationLedgerClock::set(domain::LedgerTime t) { now_.store(t); }

}  // namespace ledger
