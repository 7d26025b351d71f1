#pragma once

#include "ledger/domain/condition.hpp"
#include "ledger/domain/escrow.hpp"
#include "ledger/domain/invoice.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/transaction.hpp"

#include <nlohmann/json.hpp>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for persisted records
// -----------------------------------------------------------------------------
// ADL hooks picked up by nlohmann::json's get<T>() and implicit conversion.
//
// Amounts are written as decimal strings. Enums are written by name.
// from_json throws std::runtime_error on an unknown enum name or a malformed
// amount; nlohmann::json throws its own exceptions for missing keys or wrong
// types. Either way a corrupt record is a host fault, not a ContractError.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Party& party);
void from_json(const nlohmann::json& j, Party& party);

void to_json(nlohmann::json& j, const Condition& condition);
void from_json(const nlohmann::json& j, Condition& condition);

void to_json(nlohmann::json& j, const Transaction& tx);
void from_json(const nlohmann::json& j, Transaction& tx);

void to_json(nlohmann::json& j, const Escrow& escrow);
void from_json(const nlohmann::json& j, Escrow& escrow);

void to_json(nlohmann::json& j, const Invoice& invoice);
void from_json(const nlohmann::json& j, Invoice& invoice);

// Amount helpers shared with the command layer.
nlohmann::json amountToJson(Amount amount);
Amount amountFromJson(const nlohmann::json& j);

}  // namespace domain
}  // namespace ledger
