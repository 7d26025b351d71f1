#pragma once

#include "ledger/events/escrow_update_event.hpp"
#include "ledger/events/invoice_update_event.hpp"
#include "ledger/events/transaction_event.hpp"

#include <variant>

namespace ledger {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for every ledger event. One EventBus
// carries all of them; subscribers pick the alternatives they care about via
// the typed subscribe<T>() or std::get_if.
//
// Adding an event type means adding it here; std::visit sites then fail to
// compile until they handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TransactionEvent,
    EscrowUpdateEvent,
    InvoiceUpdateEvent>;

}  // namespace ledger
