#pragma once

#include <gmpxx.h>

#include "zkvote/crypto/paillier.hpp"

namespace zkvote {

// Proof of knowledge of (m, r) with c = g^m r^n mod n^2, bound to that ciphertext through the
// Paillier homomorphism. Commitment a = g^x s^n, response v = x - e*m mod n,
// w = s * r^-e mod n, accepted iff g^v w^n c^e == a mod n^2.

// Single-use ephemeral values. Reusing them across rounds leaks the witness.
struct SigmaNonce {
  mpz_class x;
  mpz_class s;
};

struct SigmaCommitment {
  mpz_class a;
};

struct SigmaResponse {
  mpz_class v;
  mpz_class w;
};

struct SigmaCommitResult {
  SigmaNonce nonce;
  SigmaCommitment commitment;
};

// Everything a voter keeps between casting a ballot and answering the challenge.
struct ProverWitness {
  mpz_class plaintext;
  mpz_class randomness;
  SigmaNonce nonce;
  SigmaCommitment commitment;
};

SigmaCommitResult SigmaCommit(const PaillierPublicKey& public_key);
SigmaCommitment SigmaCommitWithNonce(const PaillierPublicKey& public_key, const SigmaNonce& nonce);

// Uniform in [1, n).
mpz_class SigmaChallenge(const PaillierPublicKey& public_key);

SigmaResponse SigmaRespond(const PaillierPublicKey& public_key,
                           const SigmaNonce& nonce,
                           const mpz_class& challenge,
                           const mpz_class& plaintext,
                           const mpz_class& randomness);

// Out-of-range inputs are rejected, never thrown.
bool SigmaVerify(const PaillierPublicKey& public_key,
                 const SigmaCommitment& commitment,
                 const SigmaResponse& response,
                 const mpz_class& challenge,
                 const mpz_class& ciphertext);

}  // namespace zkvote
