#include "zkvote/crypto/paillier.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "zkvote/common/errors.hpp"
#include "zkvote/crypto/random.hpp"

namespace zkvote {
namespace {

constexpr int kMaxDistinctPrimeAttempts = 1024;

mpz_class NormalizeModN(const mpz_class& value, const mpz_class& n) {
  mpz_class out;
  mpz_mod(out.get_mpz_t(), value.get_mpz_t(), n.get_mpz_t());
  return out;
}

}  // namespace

bool IsZnStarElement(const mpz_class& value, const mpz_class& modulus) {
  if (modulus < 2 || value <= 0 || value >= modulus) {
    return false;
  }

  mpz_class gcd;
  mpz_gcd(gcd.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());
  return gcd == 1;
}

bool IsValidPaillierPublicKey(const PaillierPublicKey& public_key) {
  return public_key.n > 2 && public_key.g == public_key.n + 1;
}

void ValidatePaillierPublicKey(const PaillierPublicKey& public_key) {
  if (public_key.n <= 2) {
    throw std::invalid_argument("Paillier modulus n must be > 2");
  }
  if (public_key.g != public_key.n + 1) {
    throw std::invalid_argument("Paillier generator must be n + 1");
  }
}

mpz_class PaillierModulusSquared(const PaillierPublicKey& public_key) {
  return public_key.n * public_key.n;
}

bool IsValidCiphertext(const PaillierPublicKey& public_key, const mpz_class& ciphertext) {
  if (!IsValidPaillierPublicKey(public_key)) {
    return false;
  }
  if (ciphertext <= 0 || ciphertext >= PaillierModulusSquared(public_key)) {
    return false;
  }

  mpz_class gcd;
  mpz_gcd(gcd.get_mpz_t(), ciphertext.get_mpz_t(), public_key.n.get_mpz_t());
  return gcd == 1;
}

bool IsPlaintextInRange(const PaillierPublicKey& public_key, const mpz_class& value) {
  const mpz_class magnitude = abs(value);
  return 2 * magnitude < public_key.n;
}

mpz_class CenterModN(const mpz_class& value, const mpz_class& n) {
  mpz_class out = NormalizeModN(value, n);
  if (2 * out > n) {
    out -= n;
  }
  return out;
}

PaillierKeyPair BuildPaillierKeyPair(const mpz_class& p, const mpz_class& q) {
  if (!IsPrime(p) || !IsPrime(q)) {
    throw KeyGenerationError("Paillier factors must both be prime");
  }
  if (p == q) {
    throw KeyGenerationError("Paillier factors must be distinct");
  }

  PaillierKeyPair out;
  out.private_key.p = p;
  out.private_key.q = q;
  out.public_key.n = p * q;
  out.public_key.g = out.public_key.n + 1;
  out.private_key.lambda = (p - 1) * (q - 1);

  if (mpz_invert(out.private_key.mu.get_mpz_t(),
                 out.private_key.lambda.get_mpz_t(),
                 out.public_key.n.get_mpz_t()) == 0) {
    throw KeyGenerationError("lambda is not invertible mod n for p=" + p.get_str() +
                             ", q=" + q.get_str());
  }
  return out;
}

PaillierKeyPair GeneratePaillierKeyPair(const PrimeRange& range) {
  const mpz_class p = GenerateRandomPrime(range);
  for (int attempt = 0; attempt < kMaxDistinctPrimeAttempts; ++attempt) {
    const mpz_class q = GenerateRandomPrime(range);
    if (q != p) {
      return BuildPaillierKeyPair(p, q);
    }
  }
  throw KeyGenerationError("prime range [" + range.min.get_str() + ", " + range.max.get_str() +
                           "] holds fewer than two primes");
}

PaillierKeyPair GeneratePaillierKeyPairBits(unsigned long prime_bits) {
  const mpz_class p = GenerateRandomPrimeBits(prime_bits);
  for (int attempt = 0; attempt < kMaxDistinctPrimeAttempts; ++attempt) {
    const mpz_class q = GenerateRandomPrimeBits(prime_bits);
    if (q != p) {
      return BuildPaillierKeyPair(p, q);
    }
  }
  throw KeyGenerationError("no two distinct " + std::to_string(prime_bits) + "-bit primes found");
}

mpz_class PaillierDecrypt(const PaillierKeyPair& key_pair, const mpz_class& ciphertext) {
  const mpz_class& n = key_pair.public_key.n;
  const mpz_class n2 = PaillierModulusSquared(key_pair.public_key);
  if (ciphertext < 0 || ciphertext >= n2) {
    throw DecryptionError("ciphertext is outside [0, n^2)");
  }

  mpz_class c_lambda;
  mpz_powm(c_lambda.get_mpz_t(), ciphertext.get_mpz_t(),
           key_pair.private_key.lambda.get_mpz_t(), n2.get_mpz_t());

  const mpz_class numerator = c_lambda - 1;
  if (numerator < 0 || mpz_divisible_p(numerator.get_mpz_t(), n.get_mpz_t()) == 0) {
    throw DecryptionError("L(c^lambda mod n^2) is not an exact multiple of n");
  }

  mpz_class l;
  mpz_divexact(l.get_mpz_t(), numerator.get_mpz_t(), n.get_mpz_t());
  return CenterModN(l * key_pair.private_key.mu, n);
}

PaillierProvider::PaillierProvider(const PaillierPublicKey& public_key)
    : public_key_(public_key) {
  ValidatePaillierPublicKey(public_key_);

  pk_ = pcs_init_public_key();
  if (pk_ == nullptr) {
    throw std::runtime_error("Failed to initialize libhcs Paillier public key");
  }

  mpz_set(pk_->n, public_key_.n.get_mpz_t());
  mpz_mul(pk_->n2, public_key_.n.get_mpz_t(), public_key_.n.get_mpz_t());
  mpz_set(pk_->g, public_key_.g.get_mpz_t());
}

PaillierProvider::~PaillierProvider() {
  Cleanup();
}

PaillierProvider::PaillierProvider(PaillierProvider&& other) noexcept
    : public_key_(std::move(other.public_key_)), pk_(other.pk_) {
  other.pk_ = nullptr;
}

PaillierProvider& PaillierProvider::operator=(PaillierProvider&& other) noexcept {
  if (this != &other) {
    Cleanup();
    public_key_ = std::move(other.public_key_);
    pk_ = other.pk_;
    other.pk_ = nullptr;
  }
  return *this;
}

PaillierCiphertextWithRandom PaillierProvider::EncryptWithRandom(const mpz_class& value) const {
  PaillierCiphertextWithRandom out;
  out.randomness = Csprng::RandomZnStar(public_key_.n);
  out.ciphertext = EncryptWithProvidedRandom(value, out.randomness);
  return out;
}

mpz_class PaillierProvider::EncryptWithProvidedRandom(const mpz_class& value,
                                                      const mpz_class& randomness) const {
  if (!IsPlaintextInRange(public_key_, value)) {
    throw EncryptionError("plaintext " + value.get_str() + " is outside (-n/2, n/2)");
  }
  if (!IsZnStarElement(randomness, public_key_.n)) {
    throw std::invalid_argument("Paillier randomness must be in Z*_N");
  }

  mpz_class plain = NormalizeModN(value, public_key_.n);
  mpz_class rand = randomness;
  mpz_class out;
  pcs_encrypt_r(pk_, out.get_mpz_t(), plain.get_mpz_t(), rand.get_mpz_t());
  return out;
}

mpz_class PaillierProvider::AddCiphertexts(const mpz_class& lhs_cipher,
                                           const mpz_class& rhs_cipher) const {
  mpz_class lhs = lhs_cipher;
  mpz_class rhs = rhs_cipher;
  mpz_class out;
  pcs_ee_add(pk_, out.get_mpz_t(), lhs.get_mpz_t(), rhs.get_mpz_t());
  return out;
}

mpz_class PaillierProvider::SumCiphertexts(const std::vector<mpz_class>& ciphertexts) const {
  mpz_class acc = 1;
  for (const mpz_class& cipher : ciphertexts) {
    acc = AddCiphertexts(acc, cipher);
  }
  return acc;
}

const PaillierPublicKey& PaillierProvider::public_key() const {
  return public_key_;
}

mpz_class PaillierProvider::modulus_n() const {
  return public_key_.n;
}

mpz_class PaillierProvider::modulus_n2() const {
  return PaillierModulusSquared(public_key_);
}

mpz_class PaillierProvider::generator() const {
  return public_key_.g;
}

void PaillierProvider::Cleanup() {
  if (pk_ != nullptr) {
    pcs_free_public_key(pk_);
    pk_ = nullptr;
  }
}

}  // namespace zkvote
