#pragma once

#include "ledger/store/i_durable_store.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// MemoryStore: std::map-backed IDurableStore
// -----------------------------------------------------------------------------
// Ordered map so a dump of the store (tests, JsonFileStore) lists keys in a
// stable order.
// -----------------------------------------------------------------------------
class MemoryStore : public IDurableStore {
 public:
  MemoryStore() = default;

  std::optional<nlohmann::json> get(const std::string& key) const override;
  void set(const std::string& key, nlohmann::json value) override;
  bool has(const std::string& key) const override;
  void remove(const std::string& key) override;
  void flush() override {}

  std::size_t size() const { return entries_.size(); }

 protected:
  std::map<std::string, nlohmann::json> entries_;
};

}  // namespace ledger
