#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <gmpxx.h>

#include "zkvote/common/secure_zeroize.hpp"
#include "zkvote/crypto/paillier.hpp"
#include "zkvote/crypto/sigma_proof.hpp"

namespace {

using zkvote::PaillierCiphertextWithRandom;
using zkvote::PaillierKeyPair;
using zkvote::PaillierProvider;
using zkvote::PaillierPublicKey;
using zkvote::ProverWitness;
using zkvote::SigmaCommitResult;
using zkvote::SigmaCommitment;
using zkvote::SigmaNonce;
using zkvote::SigmaResponse;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

struct Ballot {
  mpz_class plaintext;
  PaillierCiphertextWithRandom encrypted;
  SigmaCommitResult commit;
};

Ballot CastBallot(const PaillierProvider& paillier, int vote) {
  Ballot out;
  out.plaintext = vote;
  out.encrypted = paillier.EncryptWithRandom(out.plaintext);
  out.commit = zkvote::SigmaCommit(paillier.public_key());
  return out;
}

SigmaResponse Respond(const PaillierPublicKey& pub,
                      const Ballot& ballot,
                      const mpz_class& challenge,
                      const mpz_class& claimed_plaintext) {
  return zkvote::SigmaRespond(pub, ballot.commit.nonce, challenge, claimed_plaintext,
                              ballot.encrypted.randomness);
}

void TestHonestProofVerifies() {
  for (int round = 0; round < 25; ++round) {
    const PaillierKeyPair key_pair = zkvote::GeneratePaillierKeyPair(zkvote::PrimeRange{});
    const PaillierPublicKey& pub = key_pair.public_key;
    const PaillierProvider paillier(pub);

    for (int vote : {1, -1}) {
      const Ballot ballot = CastBallot(paillier, vote);
      const mpz_class challenge = zkvote::SigmaChallenge(pub);
      const SigmaResponse response = Respond(pub, ballot, challenge, ballot.plaintext);
      Expect(zkvote::SigmaVerify(pub, ballot.commit.commitment, response, challenge,
                                 ballot.encrypted.ciphertext),
             "honest proof must verify for vote " + std::to_string(vote));
    }
  }

  const PaillierKeyPair big = zkvote::GeneratePaillierKeyPairBits(128);
  const PaillierProvider paillier(big.public_key);
  const Ballot ballot = CastBallot(paillier, -1);
  const mpz_class challenge = zkvote::SigmaChallenge(big.public_key);
  Expect(zkvote::SigmaVerify(big.public_key, ballot.commit.commitment,
                             Respond(big.public_key, ballot, challenge, ballot.plaintext),
                             challenge, ballot.encrypted.ciphertext),
         "honest proof must verify under a 256-bit modulus");
}

void TestFlippedVoteRejected() {
  // n is odd and e in [1, n), so a flipped plaintext can never satisfy the check.
  for (int round = 0; round < 25; ++round) {
    const PaillierKeyPair key_pair = zkvote::GeneratePaillierKeyPair(zkvote::PrimeRange{});
    const PaillierPublicKey& pub = key_pair.public_key;
    const PaillierProvider paillier(pub);

    for (int vote : {1, -1}) {
      const Ballot ballot = CastBallot(paillier, vote);
      const mpz_class challenge = zkvote::SigmaChallenge(pub);
      const SigmaResponse forged = Respond(pub, ballot, challenge, -ballot.plaintext);
      Expect(!zkvote::SigmaVerify(pub, ballot.commit.commitment, forged, challenge,
                                  ballot.encrypted.ciphertext),
             "proof for the opposite vote must be rejected");
    }
  }
}

void TestProofBoundToCiphertext() {
  const PaillierKeyPair key_pair = zkvote::GeneratePaillierKeyPairBits(64);
  const PaillierPublicKey& pub = key_pair.public_key;
  const PaillierProvider paillier(pub);

  const Ballot ballot = CastBallot(paillier, 1);
  const mpz_class other_ciphertext = paillier.EncryptWithRandom(1).ciphertext;
  const mpz_class challenge = zkvote::SigmaChallenge(pub);
  const SigmaResponse response = Respond(pub, ballot, challenge, ballot.plaintext);

  Expect(!zkvote::SigmaVerify(pub, ballot.commit.commitment, response, challenge,
                              other_ciphertext),
         "a proof must not transfer to another encryption of the same vote");

  const SigmaCommitResult fresh = zkvote::SigmaCommit(pub);
  Expect(!zkvote::SigmaVerify(pub, fresh.commitment, response, challenge,
                              ballot.encrypted.ciphertext),
         "a proof must not verify against a different commitment");

  const mpz_class other_challenge = challenge == 1 ? mpz_class(2) : challenge - 1;
  Expect(!zkvote::SigmaVerify(pub, ballot.commit.commitment, response, other_challenge,
                              ballot.encrypted.ciphertext),
         "a proof must not verify under a different challenge");
}

void TestCommitmentWithNonce() {
  const PaillierKeyPair key_pair = zkvote::BuildPaillierKeyPair(53, 59);
  const PaillierPublicKey& pub = key_pair.public_key;
  const mpz_class n2 = zkvote::PaillierModulusSquared(pub);

  const SigmaNonce nonce{mpz_class(42), mpz_class(1001)};
  const SigmaCommitment commitment = zkvote::SigmaCommitWithNonce(pub, nonce);

  mpz_class gx;
  mpz_class sn;
  mpz_powm(gx.get_mpz_t(), pub.g.get_mpz_t(), nonce.x.get_mpz_t(), n2.get_mpz_t());
  mpz_powm(sn.get_mpz_t(), nonce.s.get_mpz_t(), pub.n.get_mpz_t(), n2.get_mpz_t());
  mpz_class expected = gx * sn;
  mpz_mod(expected.get_mpz_t(), expected.get_mpz_t(), n2.get_mpz_t());
  Expect(commitment.a == expected, "a = g^x s^n mod n^2");
  Expect(zkvote::SigmaCommitWithNonce(pub, nonce).a == commitment.a,
         "commitment is a function of the nonce");

  ExpectThrow([&]() { (void)zkvote::SigmaCommitWithNonce(pub, SigmaNonce{0, 1001}); },
              "x = 0 must be rejected");
  ExpectThrow([&]() { (void)zkvote::SigmaCommitWithNonce(pub, SigmaNonce{42, 59}); },
              "s sharing a factor with n must be rejected");

  for (int i = 0; i < 200; ++i) {
    const mpz_class e = zkvote::SigmaChallenge(pub);
    Expect(e >= 1 && e < pub.n, "challenge must be in [1, n)");
  }
}

void TestMalformedInputs() {
  const PaillierKeyPair key_pair = zkvote::BuildPaillierKeyPair(61, 67);
  const PaillierPublicKey& pub = key_pair.public_key;
  const PaillierProvider paillier(pub);
  const Ballot ballot = CastBallot(paillier, 1);
  const mpz_class challenge = zkvote::SigmaChallenge(pub);
  const SigmaResponse response = Respond(pub, ballot, challenge, ballot.plaintext);
  const SigmaCommitment& a = ballot.commit.commitment;
  const mpz_class& c = ballot.encrypted.ciphertext;

  Expect(!zkvote::SigmaVerify(pub, a, response, 0, c), "challenge 0 is rejected");
  Expect(!zkvote::SigmaVerify(pub, a, response, pub.n, c), "challenge n is rejected");
  Expect(!zkvote::SigmaVerify(pub, a, SigmaResponse{pub.n, response.w}, challenge, c),
         "v = n is rejected");
  Expect(!zkvote::SigmaVerify(pub, a, SigmaResponse{response.v, 0}, challenge, c),
         "w = 0 is rejected");
  Expect(!zkvote::SigmaVerify(pub, SigmaCommitment{0}, response, challenge, c),
         "a = 0 is rejected");
  Expect(!zkvote::SigmaVerify(pub, a, response, challenge, 0), "c = 0 is rejected");
  Expect(!zkvote::SigmaVerify(PaillierPublicKey{pub.n, pub.n}, a, response, challenge, c),
         "a malformed key is rejected");

  ExpectThrow([&]() { (void)Respond(pub, ballot, 0, ballot.plaintext); },
              "responding to challenge 0 must fail");
  ExpectThrow(
      [&]() {
        (void)zkvote::SigmaRespond(pub, ballot.commit.nonce, challenge, ballot.plaintext, 61);
      },
      "non-invertible randomness must fail");
}

void TestWitnessZeroization() {
  const PaillierKeyPair key_pair = zkvote::BuildPaillierKeyPair(71, 73);
  const PaillierProvider paillier(key_pair.public_key);
  const Ballot ballot = CastBallot(paillier, -1);

  std::optional<ProverWitness> witness = ProverWitness{
      ballot.plaintext, ballot.encrypted.randomness, ballot.commit.nonce,
      ballot.commit.commitment};
  ProverWitness copy = *witness;

  zkvote::SecureZeroize(&copy);
  Expect(copy.plaintext == 0 && copy.randomness == 0, "plaintext and randomness are wiped");
  Expect(copy.nonce.x == 0 && copy.nonce.s == 0, "nonce is wiped");

  zkvote::SecureZeroize(&witness);
  Expect(!witness.has_value(), "optional witness is released after wiping");
}

}  // namespace

int main() {
  try {
    TestHonestProofVerifies();
    TestFlippedVoteRejected();
    TestProofBoundToCiphertext();
    TestCommitmentWithNonce();
    TestMalformedInputs();
    TestWitnessZeroization();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Sigma proof tests passed" << '\n';
  return 0;
}
