#pragma once

#include <optional>
#include <string>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// Amount: signed 128-bit value in the asset's smallest unit
// -----------------------------------------------------------------------------
//
// @brief  All agreement amounts are signed 128-bit integers. Valid amounts are
//         strictly positive and no larger than half the representable
//         maximum, leaving headroom so that summing two valid amounts can
//         never overflow.
//
// @details
// __int128 is a GCC/Clang builtin. std::numeric_limits<__int128> is only
// specialized in GNU mode, so the bounds are computed explicitly below and
// the type works the same under -std=c++17 and -std=gnu++17.
//
// Amounts cross the storage and JSON boundary as decimal strings, because
// JSON numbers cannot carry 128-bit integers losslessly.
// -----------------------------------------------------------------------------
using Amount = __int128;

constexpr Amount kAmountMax =
    static_cast<Amount>((static_cast<unsigned __int128>(1) << 127) - 1);

// Largest amount accepted by any creation path.
constexpr Amount kAmountHeadroomMax = kAmountMax / 2;

// -------------------------------------------------------------------------
// isValidAmount
// -------------------------------------------------------------------------
// @return true iff 0 < amount <= kAmountHeadroomMax.
// -------------------------------------------------------------------------
constexpr bool isValidAmount(Amount amount) {
  return amount > 0 && amount <= kAmountHeadroomMax;
}

// Decimal rendering, with a leading '-' for negative values.
std::string amountToString(Amount amount);

// -------------------------------------------------------------------------
// parseAmount
// -------------------------------------------------------------------------
// @brief  Parses an optionally signed decimal string.
//
// @return The value, or std::nullopt for empty input, non-digit characters,
//         or a value outside the signed 128-bit range.
// -------------------------------------------------------------------------
std::optional<Amount> parseAmount(const std::string& text);

}  // namespace domain
}  // namespace ledger
