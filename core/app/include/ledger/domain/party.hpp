#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Party
// -----------------------------------------------------------------------------
// Responsibility: Opaque reference to a principal (sender, recipient, creator,
// client, validator, admin). The engine compares parties for equality and
// hands them to the identity verifier; it never interprets the address.
//
// Why a struct instead of a bare std::string:
// - Function signatures read as (Party sender, Party recipient) rather than
//   two interchangeable strings.
// - Prevents passing a description or memo where a party is expected.
// -----------------------------------------------------------------------------
struct Party {
  std::string address;

  bool empty() const { return address.empty(); }

  friend bool operator==(const Party& a, const Party& b) {
    return a.address == b.address;
  }
  friend bool operator!=(const Party& a, const Party& b) { return !(a == b); }
  friend bool operator<(const Party& a, const Party& b) {
    return a.address < b.address;
  }
};

}  // namespace domain
}  // namespace ledger

namespace std {
template <>
struct hash<ledger::domain::Party> {
  std::size_t operator()(const ledger::domain::Party& p) const noexcept {
    return std::hash<std::string>{}(p.address);
  }
};
}  // namespace std
