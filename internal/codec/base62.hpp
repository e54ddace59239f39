#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shortener::codec {

/*
  Radix-62 positional encoding over a fixed, permuted alphabet.

  The alphabet is part of the deployment: changing it makes every issued
  code decode to a different value. Sequential inputs produce visually
  unrelated codes because the symbols are not in canonical order.
*/

inline constexpr std::string_view kAlphabet = "RO9zDGxetiA5flHnXvU8M1WmJNqwhK6TaSVQjgPkIsFbc04pL7yoCurBdEZ32Y";
inline constexpr int64_t          kRadix    = 62;

// Issued short codes are exactly this long.
inline constexpr std::size_t kShortCodeLength = 6;

// 62^5 and 62^6 - 1: the counter range that encodes to kShortCodeLength symbols.
inline constexpr int64_t kMinSixSymbolValue = 916'132'832;
inline constexpr int64_t kMaxSixSymbolValue = 56'800'235'583;

// Most significant symbol first, no padding. nullopt for negative input.
std::optional<std::string> Encode(int64_t number);

// Reference inverse of Encode. nullopt on empty input, a symbol outside the
// alphabet, or a value that does not fit in int64_t.
std::optional<int64_t> Decode(std::string_view code);

bool IsAlphabetSymbol(char c);

inline bool HasShortCodeLength(int64_t value) {
  return value >= kMinSixSymbolValue && value <= kMaxSixSymbolValue;
}

} // namespace shortener::codec
