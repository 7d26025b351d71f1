#pragma once

#include "ledger/domain/party.hpp"
#include "ledger/domain/types.hpp"

#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// IOracleBackend
// -----------------------------------------------------------------------------
// Adjudicates OracleBased conditions. observe() returns the value the given
// oracle currently reports for feed, or std::nullopt if it has reported
// nothing. Must be side-effect-free.
// -----------------------------------------------------------------------------
class IOracleBackend {
 public:
  virtual ~IOracleBackend() = default;

  virtual std::optional<std::string> observe(const domain::Party& oracle,
                                             const std::string& feed) const = 0;
};

// -----------------------------------------------------------------------------
// IApprovalRegistry
// -----------------------------------------------------------------------------
// Adjudicates ManualApproval conditions: has validator signed off on the
// release of escrow_id? Must be side-effect-free.
// -----------------------------------------------------------------------------
class IApprovalRegistry {
 public:
  virtual ~IApprovalRegistry() = default;

  virtual bool hasApproved(const domain::Party& validator,
                           domain::EntityId escrow_id) const = 0;
};

}  // namespace ledger
