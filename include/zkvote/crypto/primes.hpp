#pragma once

#include <gmpxx.h>

namespace zkvote {

// Inclusive candidate range for Paillier prime sampling.
struct PrimeRange {
  mpz_class min = 50;
  mpz_class max = 80;
};

bool IsPrime(const mpz_class& candidate);

// Rejection-samples uniform candidates in the range until one is prime.
// Throws KeyGenerationError if the attempt budget runs out.
mpz_class GenerateRandomPrime(const PrimeRange& range);
mpz_class GenerateRandomPrimeBits(unsigned long bits);

void ValidatePrimeRange(const PrimeRange& range);

}  // namespace zkvote
