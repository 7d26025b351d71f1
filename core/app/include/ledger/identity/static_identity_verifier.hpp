#pragma once

#include "ledger/identity/i_identity_verifier.hpp"

#include <cstddef>
#include <unordered_set>

namespace ledger {

// -----------------------------------------------------------------------------
// StaticIdentityVerifier: in-process IIdentityVerifier
// -----------------------------------------------------------------------------
//
// @brief  Default verifier used by tests and the replay driver.
//
// @details
// Address validity: non-empty, at most kMaxAddressLength characters, and
// only ASCII letters, digits and the separators '_', '-', ':' and '.'.
//
// Authorization: a valid party is authorized if authorize_all is set or it
// has been added with authorize(). Invalid parties are never authorized.
// -----------------------------------------------------------------------------
class StaticIdentityVerifier final : public IIdentityVerifier {
 public:
  static constexpr std::size_t kMaxAddressLength = 128;

  explicit StaticIdentityVerifier(bool authorize_all = false)
      : authorize_all_(authorize_all) {}

  bool isValidParty(const domain::Party& party) const override;
  bool isAuthorized(const domain::Party& party) const override;

  void authorize(const domain::Party& party) { authorized_.insert(party); }
  void revoke(const domain::Party& party) { authorized_.erase(party); }

  void setAuthorizeAll(bool value) { authorize_all_ = value; }

 private:
  bool authorize_all_;
  std::unordered_set<domain::Party> authorized_;
};

}  // namespace ledger
