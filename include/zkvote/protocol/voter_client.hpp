#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <gmpxx.h>

#include "zkvote/crypto/paillier.hpp"
#include "zkvote/crypto/sigma_proof.hpp"
#include "zkvote/net/channel.hpp"
#include "zkvote/protocol/config.hpp"
#include "zkvote/protocol/session.hpp"
#include "zkvote/protocol/types.hpp"

namespace zkvote {

enum class ClientState : uint32_t {
  kConnecting = 1,
  kRoleNegotiation = 2,
  kKeyHolder = 3,
  kVoter = 4,
  kVoting = 5,
  kAwaitingChallenge = 6,
  kResponding = 7,
  kResultDecryption = 8,
  kClosed = 9,
};

const char* ClientStateName(ClientState state);

struct ClientOutcome {
  ClientId client_id;
  std::optional<ClientRole> role;
  VoteChoice vote = VoteChoice::kYes;
  bool vote_acknowledged = false;

  // Key holder only.
  std::optional<mpz_class> tally;
  std::optional<TallyOutcome> tally_outcome;
  std::string decryption_error;

  // The server's verdict on this client's proof.
  std::optional<bool> proof_accepted;

  SessionStatus status = SessionStatus::kRunning;
  std::string abort_reason;
};

// One voter's side of the election. If the server names it key holder it also generates the
// Paillier key pair, requests the tally and decrypts it.
class VoterClient : public Session {
 public:
  explicit VoterClient(ClientConfig config);
  ~VoterClient() override;

  VoterClient(const VoterClient&) = delete;
  VoterClient& operator=(const VoterClient&) = delete;

  // Runs the whole exchange on `channel` and closes it. Every failure, including a throwing
  // tally gate, ends the session (status kAborted / kTimedOut) instead of propagating.
  ClientOutcome Run(MessageChannel& channel);

  ClientState state() const;
  const ClientOutcome& outcome() const;

 private:
  WireMessage Await(MessageChannel& channel,
                    MessageType expected,
                    std::chrono::milliseconds timeout);

  void NegotiateRole(MessageChannel& channel);
  void PublishKey(MessageChannel& channel);
  void ReceiveKey(MessageChannel& channel);
  void CastVote(MessageChannel& channel);
  void RequestTally(MessageChannel& channel);
  void AnswerChallenge(MessageChannel& channel);
  void WipeSecrets();

  ClientConfig config_;
  ClientState state_ = ClientState::kConnecting;
  ClientOutcome outcome_;

  std::optional<PaillierKeyPair> key_pair_;
  std::optional<PaillierPublicKey> public_key_;
  std::optional<ProverWitness> witness_;
};

// Connects to config.host:config.port and runs a VoterClient. Throws std::runtime_error if the
// server cannot be reached.
ClientOutcome RunVoterClient(const ClientConfig& config);

}  // namespace zkvote
