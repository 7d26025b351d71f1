#include "ledger/domain/contract_error.hpp"

namespace ledger {

const char* to_string(ContractError error) {
  using E = ContractError;
  switch (error) {
    case E::InsufficientBalance:    return "InsufficientBalance";
    case E::InvalidAddress:         return "InvalidAddress";
    case E::Unauthorized:           return "Unauthorized";
    case E::InvalidAmount:          return "InvalidAmount";
    case E::TransactionNotFound:    return "TransactionNotFound";
    case E::EscrowNotFound:         return "EscrowNotFound";
    case E::ConditionsNotMet:       return "ConditionsNotMet";
    case E::EscrowExpired:          return "EscrowExpired";
    case E::InvoiceNotFound:        return "InvoiceNotFound";
    case E::InvoiceAlreadyApproved: return "InvoiceAlreadyApproved";
    case E::InvoiceExpired:         return "InvoiceExpired";
    case E::InvalidSignature:       return "InvalidSignature";
    case E::ReentrancyDetected:     return "ReentrancyDetected";
  }
  return "Unknown";
}

}  // namespace ledger
