#include "zkvote/crypto/sigma_proof.hpp"

#include <stdexcept>

#include "zkvote/crypto/random.hpp"

namespace zkvote {
namespace {

mpz_class PowMod(const mpz_class& base, const mpz_class& exp, const mpz_class& modulus) {
  mpz_class out;
  mpz_powm(out.get_mpz_t(), base.get_mpz_t(), exp.get_mpz_t(), modulus.get_mpz_t());
  return out;
}

mpz_class Mod(const mpz_class& value, const mpz_class& modulus) {
  mpz_class out;
  mpz_mod(out.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());
  return out;
}

}  // namespace

SigmaCommitResult SigmaCommit(const PaillierPublicKey& public_key) {
  ValidatePaillierPublicKey(public_key);

  SigmaCommitResult out;
  out.nonce.x = Csprng::RandomInRange(1, public_key.n - 1);
  out.nonce.s = Csprng::RandomZnStar(public_key.n);
  out.commitment = SigmaCommitWithNonce(public_key, out.nonce);
  return out;
}

SigmaCommitment SigmaCommitWithNonce(const PaillierPublicKey& public_key, const SigmaNonce& nonce) {
  ValidatePaillierPublicKey(public_key);
  if (nonce.x <= 0 || nonce.x >= public_key.n) {
    throw std::invalid_argument("Sigma nonce x must be in [1, n)");
  }
  if (!IsZnStarElement(nonce.s, public_key.n)) {
    throw std::invalid_argument("Sigma nonce s must be in Z*_n");
  }

  const mpz_class n2 = PaillierModulusSquared(public_key);
  SigmaCommitment out;
  out.a = Mod(PowMod(public_key.g, nonce.x, n2) * PowMod(nonce.s, public_key.n, n2), n2);
  return out;
}

mpz_class SigmaChallenge(const PaillierPublicKey& public_key) {
  ValidatePaillierPublicKey(public_key);
  return Csprng::RandomInRange(1, public_key.n - 1);
}

SigmaResponse SigmaRespond(const PaillierPublicKey& public_key,
                           const SigmaNonce& nonce,
                           const mpz_class& challenge,
                           const mpz_class& plaintext,
                           const mpz_class& randomness) {
  ValidatePaillierPublicKey(public_key);
  const mpz_class& n = public_key.n;
  if (challenge <= 0 || challenge >= n) {
    throw std::invalid_argument("Sigma challenge must be in [1, n)");
  }
  if (!IsZnStarElement(randomness, n)) {
    throw std::invalid_argument("encryption randomness must be invertible mod n");
  }

  mpz_class r_inv;
  mpz_invert(r_inv.get_mpz_t(), randomness.get_mpz_t(), n.get_mpz_t());

  SigmaResponse out;
  out.v = Mod(nonce.x - challenge * plaintext, n);
  out.w = Mod(nonce.s * PowMod(r_inv, challenge, n), n);
  return out;
}

bool SigmaVerify(const PaillierPublicKey& public_key,
                 const SigmaCommitment& commitment,
                 const SigmaResponse& response,
                 const mpz_class& challenge,
                 const mpz_class& ciphertext) {
  if (!IsValidPaillierPublicKey(public_key)) {
    return false;
  }
  const mpz_class& n = public_key.n;
  const mpz_class n2 = PaillierModulusSquared(public_key);

  if (challenge <= 0 || challenge >= n) {
    return false;
  }
  if (response.v < 0 || response.v >= n) {
    return false;
  }
  if (!IsZnStarElement(response.w, n)) {
    return false;
  }
  if (commitment.a <= 0 || commitment.a >= n2) {
    return false;
  }
  if (!IsValidCiphertext(public_key, ciphertext)) {
    return false;
  }

  const mpz_class lhs = Mod(PowMod(public_key.g, response.v, n2) *
                                PowMod(response.w, n, n2) *
                                PowMod(ciphertext, challenge, n2),
                            n2);
  return lhs == commitment.a;
}

}  // namespace zkvote
