#include "zkvote/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "zkvote/common/secure_zeroize.hpp"

namespace zkvote {
namespace {

mpz_class ImportBigEndian(const Bytes& bytes) {
  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

mpz_class Csprng::RandomBelow(const mpz_class& bound) {
  if (bound <= 0) {
    throw std::invalid_argument("RandomBelow bound must be positive");
  }
  if (bound == 1) {
    return 0;
  }

  const size_t bits = mpz_sizeinbase(bound.get_mpz_t(), 2);
  const size_t byte_len = (bits + 7) / 8;
  const unsigned top_bits = static_cast<unsigned>(bits % 8);

  while (true) {
    Bytes bytes = RandomBytes(byte_len);
    if (top_bits != 0) {
      bytes[0] &= static_cast<uint8_t>((1u << top_bits) - 1);
    }
    mpz_class candidate = ImportBigEndian(bytes);
    SecureZeroize(&bytes);
    if (candidate < bound) {
      return candidate;
    }
  }
}

mpz_class Csprng::RandomInRange(const mpz_class& min, const mpz_class& max) {
  if (min > max) {
    throw std::invalid_argument("RandomInRange requires min <= max");
  }
  const mpz_class span = max - min + 1;
  return min + RandomBelow(span);
}

mpz_class Csprng::RandomOddWithBits(unsigned long bits) {
  if (bits < 2) {
    throw std::invalid_argument("RandomOddWithBits requires at least 2 bits");
  }

  mpz_class low = 1;
  low <<= (bits - 1);
  mpz_class candidate = low + RandomBelow(low);
  mpz_setbit(candidate.get_mpz_t(), 0);
  return candidate;
}

mpz_class Csprng::RandomZnStar(const mpz_class& n) {
  if (n < 2) {
    throw std::invalid_argument("RandomZnStar requires n >= 2");
  }

  mpz_class candidate;
  mpz_class gcd;
  do {
    candidate = RandomBelow(n);
    mpz_gcd(gcd.get_mpz_t(), candidate.get_mpz_t(), n.get_mpz_t());
  } while (candidate == 0 || gcd != 1);

  return candidate;
}

}  // namespace zkvote
