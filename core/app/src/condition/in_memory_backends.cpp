#include "ledger/condition/in_memory_backends.hpp"

namespace ledger {

std::optional<std::string> InMemoryOracle::observe(
    const domain::Party& oracle, const std::string& feed) const {
  auto it = values_.find({oracle, feed});
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryOracle::publish(const domain::Party& oracle,
                             const std::string& feed, std::string value) {
  values_[{oracle, feed}] = std::move(value);
}

void InMemoryOracle::clear(const domain::Party& oracle,
                           const std::string& feed) {
  values_.erase({oracle, feed});
}

bool InMemoryApprovalRegistry::hasApproved(const domain::Party& validator,
                                           domain::EntityId escrow_id) const {
  return approvals_.count({validator, escrow_id}) != 0;
}

void InMemoryApprovalRegistry::approve(const domain::Party& validator,
                                       domain::EntityId escrow_id) {
  approvals_.insert({validator, escrow_id});
}

void InMemoryApprovalRegistry::revoke(const domain::Party& validator,
                                      domain::EntityId escrow_id) {
  approvals_.erase({validator, escrow_id});
}

}  // namespace ledger
