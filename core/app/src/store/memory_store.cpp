#include "ledger/store/memory_store.hpp"

namespace ledger {

std::optional<nlohmann::json> MemoryStore::get(const std::string& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStore::set(const std::string& key, nlohmann::json value) {
  entries_[key] = std::move(value);
}

bool MemoryStore::has(const std::string& key) const {
  return entries_.count(key) != 0;
}

void MemoryStore::remove(const std::string& key) { entries_.erase(key); }

}  // namespace ledger
