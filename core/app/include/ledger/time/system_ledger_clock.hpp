#pragma once

#include "ledger/time/i_ledger_clock.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// SystemLedgerClock: wall-clock implementation of ILedgerClock
// -----------------------------------------------------------------------------
// Returns std::chrono::system_clock::now() truncated to whole seconds. Not
// replay-safe; used only when the engine runs interactively without a host
// supplying ledger time.
// -----------------------------------------------------------------------------
class SystemLedgerClock final : public ILedgerClock {
 public:
  domain::LedgerTime now() const override;
};

}  // namespace ledger
