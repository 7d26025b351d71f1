#pragma once

#include "ledger/domain/contract_error.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace ledger {

// -----------------------------------------------------------------------------
// Result<T>: value-or-ContractError
// -----------------------------------------------------------------------------
//
// @brief  Return type of every engine operation. Holds either the success
//         payload or the ContractError explaining why the operation did not
//         apply.
//
// @details
// Backed by std::variant<T, ContractError>, the same vocabulary type the
// event layer uses. Both constructors are implicit so workflow code can write
//
//   return ContractError::EscrowNotFound;
//   return escrow;
//
// and let the return type do the wrapping.
//
// Accessing value() on an error (or error() on a value) throws
// std::bad_variant_access; callers check ok() first.
//
// Status is the payload-free form, used by operations such as initialize().
// -----------------------------------------------------------------------------
template <typename T>
class Result {
  static_assert(!std::is_same<T, ContractError>::value,
                "Result<ContractError> is ambiguous");

 public:
  Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
  Result(ContractError error) : state_(std::in_place_index<1>, error) {}

  bool ok() const { return state_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<0>(state_); }
  T& value() & { return std::get<0>(state_); }
  T&& value() && { return std::get<0>(std::move(state_)); }

  ContractError error() const { return std::get<1>(state_); }

 private:
  std::variant<T, ContractError> state_;
};

using Status = Result<std::monostate>;

// Success value for Status-returning operations.
inline Status okStatus() { return Status(std::monostate{}); }

}  // namespace ledger
