#include "ledger/identity/static_identity_verifier.hpp"

#include <algorithm>
#include <cctype>

namespace ledger {

bool StaticIdentityVerifier::isValidParty(const domain::Party& party) const {
  const std::string& addr = party.address;
  if (addr.empty() || addr.size() > kMaxAddressLength) {
    return false;
  }

  return std::all_of(addr.begin(), addr.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '-' || c == ':' || c == '.';
  });
}

bool StaticIdentityVerifier::isAuthorized(const domain::Party& party) const {
  if (!isValidParty(party)) {
    return false;
  }
  return authorize_all_ || authorized_.count(party) != 0;
}

}  // namespace ledger
