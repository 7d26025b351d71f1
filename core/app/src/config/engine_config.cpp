#include "ledger/config/engine_config.hpp"

#include <fstream>
#include <stdexcept>

namespace ledger {

namespace {

// Reads doc[key] as T if present, wrapping type errors with the key name.
template <typename T>
void readOptional(const nlohmann::json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("EngineConfig: bad value for '") +
                             key + "': " + e.what());
  }
}

std::vector<domain::Party> readParties(const nlohmann::json& doc,
                                       const char* key) {
  std::vector<std::string> addresses;
  readOptional(doc, key, addresses);

  std::vector<domain::Party> parties;
  parties.reserve(addresses.size());
  for (auto& address : addresses) {
    parties.push_back(domain::Party{std::move(address)});
  }
  return parties;
}

}  // namespace

EngineConfig parseEngineConfig(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw std::runtime_error("EngineConfig: top-level value must be an object");
  }

  EngineConfig config;
  readOptional(doc, "store_path", config.store_path);
  readOptional(doc, "genesis_time", config.genesis_time);
  readOptional(doc, "authorize_all", config.authorize_all);
  readOptional(doc, "enforce_balances", config.enforce_balances);
  config.authorized_parties = readParties(doc, "authorized_parties");
  config.trusted_validators = readParties(doc, "trusted_validators");

  std::string clock = "simulation";
  readOptional(doc, "clock", clock);
  if (clock == "simulation") {
    config.clock = ClockMode::Simulation;
  } else if (clock == "system") {
    config.clock = ClockMode::System;
  } else {
    throw std::runtime_error("EngineConfig: bad value for 'clock': " + clock);
  }

  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("EngineConfig: cannot open " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("EngineConfig: cannot parse " + path + ": " +
                             e.what());
  }
  return parseEngineConfig(doc);
}

}  // namespace ledger
