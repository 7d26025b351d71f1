#include "ledger/guard/reentrancy_guard.hpp"

#include <iostream>

namespace ledger {

Status ReentrancyGuard::enter() {
  if (held_) {
    std::cerr << "[ReentrancyGuard] WARNING: nested invocation refused\n";
    return ContractError::ReentrancyDetected;
  }
  held_ = true;
  return okStatus();
}

}  // namespace ledger
