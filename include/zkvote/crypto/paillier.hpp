#pragma once

#include <vector>

#include <gmpxx.h>

extern "C" {
#include <libhcs/pcs.h>
}

#include "zkvote/crypto/primes.hpp"

namespace zkvote {

struct PaillierPublicKey {
  mpz_class g;
  mpz_class n;
};

struct PaillierPrivateKey {
  mpz_class p;
  mpz_class q;
  mpz_class lambda;
  mpz_class mu;
};

struct PaillierKeyPair {
  PaillierPublicKey public_key;
  PaillierPrivateKey private_key;
};

struct PaillierCiphertextWithRandom {
  mpz_class ciphertext;
  mpz_class randomness;
};

bool IsZnStarElement(const mpz_class& value, const mpz_class& modulus);
bool IsValidPaillierPublicKey(const PaillierPublicKey& public_key);
void ValidatePaillierPublicKey(const PaillierPublicKey& public_key);
bool IsValidCiphertext(const PaillierPublicKey& public_key, const mpz_class& ciphertext);
bool IsPlaintextInRange(const PaillierPublicKey& public_key, const mpz_class& value);
mpz_class PaillierModulusSquared(const PaillierPublicKey& public_key);

// Maps a residue mod n to the signed representative in (-n/2, n/2].
mpz_class CenterModN(const mpz_class& value, const mpz_class& n);

PaillierKeyPair BuildPaillierKeyPair(const mpz_class& p, const mpz_class& q);
PaillierKeyPair GeneratePaillierKeyPair(const PrimeRange& range);
PaillierKeyPair GeneratePaillierKeyPairBits(unsigned long prime_bits);

mpz_class PaillierDecrypt(const PaillierKeyPair& key_pair, const mpz_class& ciphertext);

// Public-key operations, executed by libhcs on a key imported from (g, n).
class PaillierProvider {
 public:
  explicit PaillierProvider(const PaillierPublicKey& public_key);
  ~PaillierProvider();

  PaillierProvider(const PaillierProvider&) = delete;
  PaillierProvider& operator=(const PaillierProvider&) = delete;

  PaillierProvider(PaillierProvider&& other) noexcept;
  PaillierProvider& operator=(PaillierProvider&& other) noexcept;

  PaillierCiphertextWithRandom EncryptWithRandom(const mpz_class& value) const;
  mpz_class EncryptWithProvidedRandom(const mpz_class& value, const mpz_class& randomness) const;

  mpz_class AddCiphertexts(const mpz_class& lhs_cipher, const mpz_class& rhs_cipher) const;
  // Product of all ciphertexts mod n^2. The empty sum is 1, an encryption of zero.
  mpz_class SumCiphertexts(const std::vector<mpz_class>& ciphertexts) const;

  const PaillierPublicKey& public_key() const;
  mpz_class modulus_n() const;
  mpz_class modulus_n2() const;
  mpz_class generator() const;

 private:
  void Cleanup();

  PaillierPublicKey public_key_;
  pcs_public_key* pk_ = nullptr;
};

}  // namespace zkvote
