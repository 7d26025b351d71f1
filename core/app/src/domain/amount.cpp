#include "ledger/domain/amount.hpp"

#include <algorithm>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// amountToString: repeated division, digits collected in reverse
// -----------------------------------------------------------------------------
std::string amountToString(Amount amount) {
  if (amount == 0) {
    return "0";
  }

  // Work on the unsigned magnitude so the minimum value does not overflow
  // when negated.
  const bool negative = amount < 0;
  unsigned __int128 magnitude =
      negative ? static_cast<unsigned __int128>(-(amount + 1)) + 1
               : static_cast<unsigned __int128>(amount);

  std::string digits;
  while (magnitude != 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
    magnitude /= 10;
  }
  if (negative) {
    digits.push_back('-');
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

// -----------------------------------------------------------------------------
// parseAmount: accumulate with an explicit overflow check per digit
// -----------------------------------------------------------------------------
std::optional<Amount> parseAmount(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    pos = 1;
  }
  if (pos == text.size()) {
    return std::nullopt;
  }

  // Magnitude limit: 2^127 - 1 for positives, 2^127 for negatives.
  const unsigned __int128 limit =
      static_cast<unsigned __int128>(kAmountMax) + (negative ? 1 : 0);

  unsigned __int128 magnitude = 0;
  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const unsigned digit = static_cast<unsigned>(c - '0');
    if (magnitude > (limit - digit) / 10) {
      return std::nullopt;
    }
    magnitude = magnitude * 10 + digit;
  }

  if (negative) {
    if (magnitude == limit) {
      return -kAmountMax - 1;
    }
    return -static_cast<Amount>(magnitude);
  }
  return static_cast<Amount>(magnitude);
}

}  // namespace domain
}  // namespace ledger
