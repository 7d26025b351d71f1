#pragma once

#include "ledger/domain/lifecycle.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <string>

namespace ledger {
namespace keys {

// -----------------------------------------------------------------------------
// Storage key layout
// -----------------------------------------------------------------------------
//   admin                      singleton, the initialized admin party
//   counter/<kind>             last id issued for an entity kind
//   transaction/<id>           Transaction record
//   escrow/<id>                Escrow record
//   invoice/<id>               Invoice record
//   tx_by_party/<address>      ascending transaction ids for a party
//   balance/<address>          journal balance of a party
//   journal/<reference>        journal entry of one accepted movement
//
// <kind> is the lower-case entity kind name.
// -----------------------------------------------------------------------------

inline std::string admin() { return "admin"; }

inline std::string kindTag(domain::EntityKind kind) {
  return domain::to_string(kind);
}

inline std::string counter(domain::EntityKind kind) {
  return "counter/" + kindTag(kind);
}

inline std::string record(domain::EntityKind kind, domain::EntityId id) {
  return kindTag(kind) + "/" + std::to_string(id);
}

inline std::string partyHistory(const domain::Party& party) {
  return "tx_by_party/" + party.address;
}

inline std::string balance(const domain::Party& party) {
  return "balance/" + party.address;
}

inline std::string journalEntry(const std::string& reference) {
  return "journal/" + reference;
}

}  // namespace keys
}  // namespace ledger
