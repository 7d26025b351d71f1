#pragma once

#include "ledger/domain/escrow.hpp"

#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// EscrowUpdateEvent
// -----------------------------------------------------------------------------
// Published by EscrowWorkflow on creation (previous_status == status ==
// Active) and on every terminal transition. confirmation is set when value
// moved out of custody.
// -----------------------------------------------------------------------------
struct EscrowUpdateEvent {
  domain::EntityId escrow_id{};
  domain::EscrowStatus previous_status{domain::EscrowStatus::Active};
  domain::EscrowStatus status{domain::EscrowStatus::Active};
  std::optional<std::string> confirmation;
  domain::LedgerTime ledger_time{0};
};

}  // namespace ledger
