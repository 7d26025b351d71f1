#pragma once

#include "ledger/domain/party.hpp"

namespace ledger {

// -----------------------------------------------------------------------------
// IIdentityVerifier
// -----------------------------------------------------------------------------
//
// @brief  Host-side identity checks consumed by the workflows.
//
// @details
//   isValidParty(p)  : p is a well-formed principal reference. Workflows map
//                      false to InvalidAddress.
//   isAuthorized(p)  : p has authorized the current invocation (signed it,
//                      or approved the value it moves). Workflows map false
//                      to Unauthorized.
//
// Side-effects: None. Both calls are pure queries.
// -----------------------------------------------------------------------------
class IIdentityVerifier {
 public:
  virtual ~IIdentityVerifier() = default;

  virtual bool isValidParty(const domain::Party& party) const = 0;

  virtual bool isAuthorized(const domain::Party& party) const = 0;
};

}  // namespace ledger
