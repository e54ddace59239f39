#include "base62.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace shortener::codec {

namespace {

constexpr std::array<int8_t, 256> BuildReverseTable() {
  std::array<int8_t, 256> table{};
  for (auto& slot : table) slot = -1;
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

constexpr auto kReverse = BuildReverseTable();

static_assert(kAlphabet.size() == kRadix, "alphabet must hold exactly 62 symbols");

} // namespace

std::optional<std::string> Encode(int64_t number) {
  if (number < 0) return std::nullopt;
  if (number == 0) return std::string(1, kAlphabet[0]);

  std::string out;
  while (number > 0) {
    out.push_back(kAlphabet[static_cast<std::size_t>(number % kRadix)]);
    number /= kRadix;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<int64_t> Decode(std::string_view code) {
  if (code.empty()) return std::nullopt;

  constexpr auto kMax  = std::numeric_limits<int64_t>::max();
  int64_t        value = 0;
  for (char c : code) {
    const int digit = kReverse[static_cast<unsigned char>(c)];
    if (digit < 0) return std::nullopt;
    if (value > (kMax - digit) / kRadix) return std::nullopt;
    value = value * kRadix + digit;
  }
  return value;
}

bool IsAlphabetSymbol(char c) {
  return kReverse[static_cast<unsigned char>(c)] >= 0;
}

} // namespace shortener::codec
