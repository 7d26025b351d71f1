#include "ledger/time/system_ledger_clock.hpp"

#include <chrono>

namespace ledger {

domain::LedgerTime SystemLedgerClock::now() const {
  auto now = std::chrono::system_clock::now();
  auto duration = now.time_since_epoch();
  return static_cast<domain::LedgerTime>(
      std::chrono::duration_cast<std::chrono::seconds>(duration).count());
}

}  // namespace ledger
