#include "ledger/store/transactional_store.hpp"

namespace ledger {

std::optional<nlohmann::json> TransactionalStore::get(
    const std::string& key) const {
  auto it = pending_.find(key);
  if (it != pending_.end()) {
    return it->second;  // nullopt = removed in this invocation
  }
  return backing_.get(key);
}

void TransactionalStore::set(const std::string& key, nlohmann::json value) {
  pending_[key] = std::move(value);
}

bool TransactionalStore::has(const std::string& key) const {
  auto it = pending_.find(key);
  if (it != pending_.end()) {
    return it->second.has_value();
  }
  return backing_.has(key);
}

void TransactionalStore::remove(const std::string& key) {
  pending_[key] = std::nullopt;
}

// -----------------------------------------------------------------------------
// commit(): apply buffered writes to the backing store, then clear
// -----------------------------------------------------------------------------
void TransactionalStore::commit() {
  for (auto& [key, value] : pending_) {
    if (value.has_value()) {
      backing_.set(key, std::move(*value));
    } else {
      backing_.remove(key);
    }
  }
  pending_.clear();
}

void TransactionalStore::rollback() { pending_.clear(); }

}  // namespace ledger
