#pragma once

#include <cstddef>

#include <gmpxx.h>

#include "zkvote/common/bytes.hpp"

namespace zkvote {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);

  // Uniform in [0, bound).
  static mpz_class RandomBelow(const mpz_class& bound);
  // Uniform in [min, max], both inclusive.
  static mpz_class RandomInRange(const mpz_class& min, const mpz_class& max);
  // Uniform odd integer with exactly `bits` significant bits.
  static mpz_class RandomOddWithBits(unsigned long bits);
  // Uniform element of Z*_n.
  static mpz_class RandomZnStar(const mpz_class& n);
};

}  // namespace zkvote
