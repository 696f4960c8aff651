#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace scavenger::util {

/*
  Overflow-checked unsigned arithmetic.

  Products are formed in 128 bits and range-checked before narrowing, so no
  intermediate result ever wraps. Every failure throws util::Overflow naming
  the quantity being computed.
*/

inline uint64_t CheckedMul(uint64_t a, uint64_t b, std::string_view what) {
  const unsigned __int128 wide = static_cast<unsigned __int128>(a) * static_cast<unsigned __int128>(b);
  if (wide > static_cast<unsigned __int128>(UINT64_MAX)) {
    throw Overflow("overflow computing " + std::string(what));
  }
  return static_cast<uint64_t>(wide);
}

inline uint64_t CheckedAdd(uint64_t a, uint64_t b, std::string_view what) {
  if (a > UINT64_MAX - b) {
    throw Overflow("overflow computing " + std::string(what));
  }
  return a + b;
}

inline uint64_t CheckedSub(uint64_t a, uint64_t b, std::string_view what) {
  if (b > a) {
    throw Overflow("underflow computing " + std::string(what));
  }
  return a - b;
}

// value * percent / 100, with the product checked.
inline uint64_t PercentOf(uint64_t value, uint32_t percent, std::string_view what) {
  return CheckedMul(value, percent, what) / 100;
}

} // namespace scavenger::util
