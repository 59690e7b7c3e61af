#include "zkvote/crypto/primes.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "zkvote/common/errors.hpp"
#include "zkvote/crypto/random.hpp"

namespace zkvote {
namespace {

constexpr int kMillerRabinRounds = 40;
constexpr size_t kMaxRangeSamplingAttempts = 1u << 16;
constexpr size_t kMaxBitsSamplingAttempts = 1u << 20;

bool IsPrimeByTrialDivision(unsigned long value) {
  if (value < 2) {
    return false;
  }
  if (value % 2 == 0) {
    return value == 2;
  }
  for (unsigned long divisor = 3; divisor <= value / divisor; divisor += 2) {
    if (value % divisor == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool IsPrime(const mpz_class& candidate) {
  if (candidate < 2) {
    return false;
  }
  if (candidate <= UINT32_MAX) {
    return IsPrimeByTrialDivision(candidate.get_ui());
  }
  return mpz_probab_prime_p(candidate.get_mpz_t(), kMillerRabinRounds) != 0;
}

void ValidatePrimeRange(const PrimeRange& range) {
  if (range.min < 2) {
    throw std::invalid_argument("prime range minimum must be >= 2");
  }
  if (range.max <= range.min) {
    throw std::invalid_argument("prime range maximum must exceed the minimum");
  }
}

mpz_class GenerateRandomPrime(const PrimeRange& range) {
  ValidatePrimeRange(range);

  for (size_t attempt = 0; attempt < kMaxRangeSamplingAttempts; ++attempt) {
    const mpz_class candidate = Csprng::RandomInRange(range.min, range.max);
    if (IsPrime(candidate)) {
      return candidate;
    }
  }
  throw KeyGenerationError("no prime found in range [" + range.min.get_str() + ", " +
                           range.max.get_str() + "]");
}

mpz_class GenerateRandomPrimeBits(unsigned long bits) {
  if (bits < 3) {
    throw std::invalid_argument("prime bit length must be >= 3");
  }

  for (size_t attempt = 0; attempt < kMaxBitsSamplingAttempts; ++attempt) {
    const mpz_class candidate = Csprng::RandomOddWithBits(bits);
    if (IsPrime(candidate)) {
      return candidate;
    }
  }
  throw KeyGenerationError("no " + std::to_string(bits) + "-bit prime found");
}

}  // namespace zkvote
