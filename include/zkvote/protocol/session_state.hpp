#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <gmpxx.h>

#include "zkvote/crypto/paillier.hpp"
#include "zkvote/crypto/sigma_proof.hpp"
#include "zkvote/net/channel.hpp"
#include "zkvote/protocol/config.hpp"
#include "zkvote/protocol/types.hpp"

namespace zkvote {

// Moves forward only.
enum class ServerPhase : uint32_t {
  kRegistering = 1,
  kKeyDistribution = 2,
  kCollecting = 3,
  kTallying = 4,
  kChallenging = 5,
  kVerifying = 6,
  kClosed = 7,
};

const char* ServerPhaseName(ServerPhase phase);

struct VoteRecord {
  ClientId voter_id;
  mpz_class ciphertext;
  SigmaCommitment commitment;
};

enum class VerificationOutcome : uint32_t {
  kPending = 0,
  kVerified = 1,
  kProofRejected = 2,
  kTimedOut = 3,
  kWithdrawn = 4,
};

const char* VerificationOutcomeName(VerificationOutcome outcome);

struct VoterVerification {
  ClientId client_id;
  bool valid = false;
  VerificationOutcome outcome = VerificationOutcome::kPending;
};

struct VerificationReport {
  // In vote arrival order.
  std::vector<VoterVerification> voters;
  // Reported back by the key holder after decrypting the encrypted sum.
  std::optional<mpz_class> tally;
  std::optional<TallyOutcome> tally_outcome;

  size_t fraud_count() const;
  bool all_valid() const;
  bool complete() const;
};

struct Registration {
  ClientId client_id;
  ClientRole role = ClientRole::kVoter;
};

struct ChallengeDispatch {
  ClientId voter_id;
  mpz_class challenge;
  std::shared_ptr<MessageChannel> channel;
};

struct TallyStart {
  PaillierPublicKey public_key;
  std::vector<mpz_class> ciphertexts;
};

// The server's single view of the election. Every connection worker goes through this object;
// all mutation happens under one mutex and proof verification runs outside it on copies.
class SessionState {
 public:
  explicit SessionState(const ServerConfig& config);

  SessionState(const SessionState&) = delete;
  SessionState& operator=(const SessionState&) = delete;

  // The first live registrant becomes key holder. Throws SessionClosedError once tallying has
  // begun, when max_voters is reached or when the id space is used up.
  Registration Register(std::shared_ptr<MessageChannel> channel);

  void PublishPublicKey(const ClientId& client_id, const PaillierPublicKey& public_key);
  // std::nullopt on timeout or shutdown.
  std::optional<PaillierPublicKey> WaitForPublicKey(std::chrono::milliseconds timeout);
  std::optional<PaillierPublicKey> public_key() const;

  void RecordVote(const ClientId& client_id,
                  const mpz_class& ciphertext,
                  const SigmaCommitment& commitment);
  bool WaitForVotes(size_t count, std::chrono::milliseconds timeout);

  // Freezes the ballot box. Throws TallyError when the requester may not tally right now.
  TallyStart BeginTally(const ClientId& requester);
  // Draws one fresh challenge per stored vote. Voters already gone are marked withdrawn.
  std::vector<ChallengeDispatch> IssueChallenges(
      std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
  void BeginVerification();

  void RecordDecryptedTally(const ClientId& client_id, const mpz_class& tally);
  // Returns the verdict. Throws ProtocolViolation if no challenge is outstanding for the client.
  bool RecordProofResponse(const ClientId& client_id,
                           const SigmaCommitment& commitment,
                           const SigmaResponse& response);

  void MarkDisconnected(const ClientId& client_id);
  size_t ExpireChallenges(
      std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  bool IsKeyHolder(const ClientId& client_id) const;
  size_t vote_count() const;
  size_t registered_count() const;
  ServerPhase phase() const;
  VerificationReport Report() const;

  // Wakes every waiter; later waits return immediately.
  void Shutdown();
  void CloseAllChannels();
  // Drops the registry and ballots. The last report stays readable.
  void Clear();

 private:
  struct ClientEntry {
    ClientRole role = ClientRole::kVoter;
    std::shared_ptr<MessageChannel> channel;
  };

  struct BallotEntry {
    VoteRecord record;
    VerificationOutcome outcome = VerificationOutcome::kPending;
    std::optional<mpz_class> challenge;
    std::chrono::steady_clock::time_point deadline;
    bool responding = false;
  };

  ClientId DrawClientIdLocked();
  void AdvanceLocked(ServerPhase next);
  BallotEntry* FindBallotLocked(const ClientId& client_id);
  void ResolveLocked(BallotEntry* ballot, VerificationOutcome outcome);
  void MaybeCloseLocked();
  VerificationReport BuildReportLocked() const;

  size_t max_voters_;
  std::chrono::milliseconds challenge_timeout_;

  mutable std::mutex mu_;
  std::condition_variable cv_;

  ServerPhase phase_ = ServerPhase::kRegistering;
  bool shutdown_ = false;

  std::set<ClientId> issued_ids_;
  std::map<ClientId, ClientEntry> clients_;
  std::optional<ClientId> key_holder_;
  std::optional<PaillierPublicKey> public_key_;

  std::vector<BallotEntry> ballots_;
  std::unordered_map<ClientId, size_t> ballot_index_;
  size_t unresolved_challenges_ = 0;

  std::optional<mpz_class> decrypted_tally_;
  std::optional<VerificationReport> final_report_;
};

}  // namespace zkvote
