#pragma once

#include "ledger/condition/i_condition_backends.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace ledger {

// -----------------------------------------------------------------------------
// InMemoryOracle: latest published value per (oracle, feed)
// -----------------------------------------------------------------------------
class InMemoryOracle final : public IOracleBackend {
 public:
  std::optional<std::string> observe(const domain::Party& oracle,
                                     const std::string& feed) const override;

  // Replaces the value oracle reports for feed.
  void publish(const domain::Party& oracle, const std::string& feed,
               std::string value);

  void clear(const domain::Party& oracle, const std::string& feed);

 private:
  std::map<std::pair<domain::Party, std::string>, std::string> values_;
};

// -----------------------------------------------------------------------------
// InMemoryApprovalRegistry: set of (validator, escrow) sign-offs
// -----------------------------------------------------------------------------
class InMemoryApprovalRegistry final : public IApprovalRegistry {
 public:
  bool hasApproved(const domain::Party& validator,
                   domain::EntityId escrow_id) const override;

  void approve(const domain::Party& validator, domain::EntityId escrow_id);
  void revoke(const domain::Party& validator, domain::EntityId escrow_id);

 private:
  std::set<std::pair<domain::Party, domain::EntityId>> approvals_;
};

}  // namespace ledger
