#pragma once

#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ledger {

enum class ClockMode {
  Simulation,  // Ledger time driven by the host / replay script
  System,      // Wall clock, seconds
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Construction-time settings for LedgerEngine. Every field has a
//         default, so an empty JSON object is a valid configuration.
//
// @details
// JSON keys (all optional):
//   "store_path"          string   JSON snapshot file; "" = in-memory store
//   "clock"               string   "simulation" (default) | "system"
//   "genesis_time"        uint     starting ledger time for the simulation
//   "authorize_all"       bool     every valid party counts as authorized
//   "authorized_parties"  [string] explicit authorizations otherwise
//   "trusted_validators"  [string] allow-list for condition validators;
//                                  empty = any valid party
//   "enforce_balances"    bool     journal transfers refuse overdrafts
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string store_path;
  ClockMode clock{ClockMode::Simulation};
  domain::LedgerTime genesis_time{0};
  bool authorize_all{false};
  std::vector<domain::Party> authorized_parties;
  std::vector<domain::Party> trusted_validators;
  bool enforce_balances{false};
};

// -----------------------------------------------------------------------------
// parseEngineConfig / loadEngineConfig
// -----------------------------------------------------------------------------
// @throws std::runtime_error naming the offending key when a value has the
//         wrong type or an unknown enumerator, or (load) when the file cannot
//         be opened or is not valid JSON.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& doc);
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace ledger
