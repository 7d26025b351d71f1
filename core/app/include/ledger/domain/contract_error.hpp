#pragma once

#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// ContractError: semantic failure kinds returned by every operation
// -----------------------------------------------------------------------------
//
// @brief  Closed set of errors an operation may report. Errors are values
//         carried in a Result<T>, never thrown.
//
// @details
// The numeric codes are stable: they are what the JSON command surface
// reports in its "code" field and what a host would map to its own error
// channel. Do not renumber.
//
// Host-level faults (corrupt persisted record, unreadable store file) are not
// in this table; they surface as exceptions and abort the invocation.
// -----------------------------------------------------------------------------
enum class ContractError : std::uint32_t {
  InsufficientBalance = 1,
  InvalidAddress = 2,
  Unauthorized = 3,
  InvalidAmount = 4,
  TransactionNotFound = 5,
  EscrowNotFound = 6,
  ConditionsNotMet = 7,
  EscrowExpired = 8,
  InvoiceNotFound = 9,
  InvoiceAlreadyApproved = 10,
  InvoiceExpired = 11,
  InvalidSignature = 12,
  ReentrancyDetected = 13,
};

const char* to_string(ContractError error);

}  // namespace ledger
