#include "internal/codec/base62.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <set>
#include <string>

namespace {

using namespace shortener::codec;

void TestAlphabetIsAPermutation() {
  assert(kAlphabet.size() == static_cast<std::size_t>(kRadix));
  std::set<char> symbols(kAlphabet.begin(), kAlphabet.end());
  assert(symbols.size() == kAlphabet.size());
  for (char c : kAlphabet) {
    assert(IsAlphabetSymbol(c));
  }
  assert(!IsAlphabetSymbol('-'));
  assert(!IsAlphabetSymbol('_'));
  assert(!IsAlphabetSymbol(' '));
}

void TestKnownValues() {
  assert(*Encode(0) == "R");
  assert(*Encode(1) == "O");
  assert(*Encode(61) == "Y");
  assert(*Encode(62) == "OR");
  assert(*Encode(124) == "9R");
  assert(*Encode(3844) == "ORR");
  assert(*Encode(1'000'000'000) == "OGsBFX");
  assert(*Encode(1'000'000'001) == "OGsBFv");
  assert(*Encode(std::numeric_limits<int64_t>::max()) == "AY1t7RVGtLe");
}

void TestNegativeInputIsRejected() {
  assert(!Encode(-1).has_value());
  assert(!Encode(std::numeric_limits<int64_t>::min()).has_value());
}

void TestSixSymbolRangeBoundaries() {
  assert(*Encode(kMinSixSymbolValue) == "ORRRRR");
  assert(*Encode(kMaxSixSymbolValue) == "YYYYYY");
  assert(Encode(kMinSixSymbolValue - 1)->size() == 5);
  assert(Encode(kMaxSixSymbolValue + 1)->size() == 7);

  assert(!HasShortCodeLength(kMinSixSymbolValue - 1));
  assert(HasShortCodeLength(kMinSixSymbolValue));
  assert(HasShortCodeLength(1'000'000'000));
  assert(HasShortCodeLength(kMaxSixSymbolValue));
  assert(!HasShortCodeLength(kMaxSixSymbolValue + 1));
}

void TestDecodeInvertsEncode() {
  for (int64_t value : {int64_t{0}, int64_t{61}, int64_t{62}, int64_t{1'000'000'000}, kMaxSixSymbolValue,
                        std::numeric_limits<int64_t>::max()}) {
    assert(*Decode(*Encode(value)) == value);
  }
  assert(*Decode("OGsBFX") == 1'000'000'000);
}

void TestDecodeRejectsMalformedInput() {
  assert(!Decode("").has_value());
  assert(!Decode("OGs-FX").has_value());
  assert(!Decode("YYYYYYYYYYYY").has_value());
}

void TestSequentialValuesGiveDistinctCodes() {
  std::set<std::string> seen;
  for (int64_t value = 1'000'000'000; value < 1'000'010'000; ++value) {
    const auto code = *Encode(value);
    assert(code.size() == kShortCodeLength);
    assert(seen.insert(code).second);
  }
}

} // namespace

int main() {
  TestAlphabetIsAPermutation();
  TestKnownValues();
  TestNegativeInputIsRejected();
  TestSixSymbolRangeBoundaries();
  TestDecodeInvertsEncode();
  TestDecodeRejectsMalformedInput();
  TestSequentialValuesGiveDistinctCodes();

  std::cout << "shortener_unit_base62: pass\n";
  return 0;
}
