#include "zkvote/protocol/session_state.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "zkvote/common/errors.hpp"
#include "zkvote/common/logging.hpp"
#include "zkvote/crypto/random.hpp"

namespace zkvote {
namespace {

constexpr unsigned long kMinClientNumber = 1000;
constexpr unsigned long kMaxClientNumber = 9999;
constexpr size_t kClientIdSpace = kMaxClientNumber - kMinClientNumber + 1;

Logger& Log() {
  static Logger logger;
  return logger;
}

}  // namespace

const char* ServerPhaseName(ServerPhase phase) {
  switch (phase) {
    case ServerPhase::kRegistering:
      return "registering";
    case ServerPhase::kKeyDistribution:
      return "key_distribution";
    case ServerPhase::kCollecting:
      return "collecting";
    case ServerPhase::kTallying:
      return "tallying";
    case ServerPhase::kChallenging:
      return "challenging";
    case ServerPhase::kVerifying:
      return "verifying";
    case ServerPhase::kClosed:
      return "closed";
  }
  return "unknown";
}

const char* VerificationOutcomeName(VerificationOutcome outcome) {
  switch (outcome) {
    case VerificationOutcome::kPending:
      return "pending";
    case VerificationOutcome::kVerified:
      return "verified";
    case VerificationOutcome::kProofRejected:
      return "proof_rejected";
    case VerificationOutcome::kTimedOut:
      return "timed_out";
    case VerificationOutcome::kWithdrawn:
      return "withdrawn";
  }
  return "unknown";
}

size_t VerificationReport::fraud_count() const {
  return static_cast<size_t>(std::count_if(voters.begin(), voters.end(), [](const auto& voter) {
    return voter.outcome == VerificationOutcome::kProofRejected;
  }));
}

bool VerificationReport::all_valid() const {
  return std::all_of(voters.begin(), voters.end(),
                     [](const VoterVerification& voter) { return voter.valid; });
}

bool VerificationReport::complete() const {
  return std::none_of(voters.begin(), voters.end(), [](const VoterVerification& voter) {
    return voter.outcome == VerificationOutcome::kPending;
  });
}

SessionState::SessionState(const ServerConfig& config)
    : max_voters_(config.max_voters),
      challenge_timeout_(config.challenge_response_timeout) {
  if (max_voters_ == 0) {
    throw std::invalid_argument("max_voters must be positive");
  }
  if (challenge_timeout_.count() <= 0) {
    throw std::invalid_argument("challenge_response_timeout must be positive");
  }
}

Registration SessionState::Register(std::shared_ptr<MessageChannel> channel) {
  if (!channel) {
    throw std::invalid_argument("Register requires a channel");
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_ || phase_ >= ServerPhase::kTallying) {
    throw SessionClosedError("session ended");
  }
  if (issued_ids_.size() >= max_voters_) {
    throw SessionClosedError("voter limit reached");
  }

  Registration out;
  out.client_id = DrawClientIdLocked();
  if (!key_holder_.has_value()) {
    key_holder_ = out.client_id;
    out.role = ClientRole::kKeyHolder;
    if (phase_ == ServerPhase::kRegistering) {
      AdvanceLocked(ServerPhase::kKeyDistribution);
    }
  }
  clients_[out.client_id] = ClientEntry{out.role, std::move(channel)};
  return out;
}

ClientId SessionState::DrawClientIdLocked() {
  if (issued_ids_.size() >= kClientIdSpace) {
    throw SessionClosedError("client id space exhausted");
  }
  while (true) {
    ClientId id = "C" + Csprng::RandomInRange(kMinClientNumber, kMaxClientNumber).get_str();
    if (issued_ids_.insert(id).second) {
      return id;
    }
  }
}

void SessionState::AdvanceLocked(ServerPhase next) {
  if (next < phase_) {
    throw std::logic_error("server phase cannot move backwards");
  }
  if (next == phase_) {
    return;
  }
  ZKVOTE_LOG(Log(), debug) << "phase " << ServerPhaseName(phase_) << " -> "
                           << ServerPhaseName(next);
  phase_ = next;
  cv_.notify_all();
}

void SessionState::PublishPublicKey(const ClientId& client_id,
                                    const PaillierPublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!key_holder_.has_value() || *key_holder_ != client_id) {
    throw ProtocolViolation("only the key holder may publish the public key");
  }
  if (public_key_.has_value()) {
    throw ProtocolViolation("public key already published");
  }
  if (phase_ != ServerPhase::kKeyDistribution) {
    throw ProtocolViolation(std::string("public key not accepted in phase ") +
                            ServerPhaseName(phase_));
  }
  if (!IsValidPaillierPublicKey(public_key)) {
    throw ProtocolViolation("malformed Paillier public key");
  }

  public_key_ = public_key;
  AdvanceLocked(ServerPhase::kCollecting);
}

std::optional<PaillierPublicKey> SessionState::WaitForPublicKey(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, timeout, [this]() { return public_key_.has_value() || shutdown_; });
  if (shutdown_) {
    return std::nullopt;
  }
  return public_key_;
}

std::optional<PaillierPublicKey> SessionState::public_key() const {
  std::lock_guard<std::mutex> lock(mu_);
  return public_key_;
}

void SessionState::RecordVote(const ClientId& client_id,
                              const mpz_class& ciphertext,
                              const SigmaCommitment& commitment) {
  std::lock_guard<std::mutex> lock(mu_);
  if (clients_.find(client_id) == clients_.end()) {
    throw ProtocolViolation("vote from unregistered client " + client_id);
  }
  if (phase_ < ServerPhase::kCollecting) {
    throw ProtocolViolation("vote received before the public key was shared");
  }
  if (phase_ > ServerPhase::kCollecting) {
    throw ProtocolViolation("voting is closed");
  }
  if (ballot_index_.count(client_id) != 0) {
    throw ProtocolViolation("duplicate vote from " + client_id);
  }
  if (!IsValidCiphertext(*public_key_, ciphertext)) {
    throw ProtocolViolation("encrypted_vote is not a valid ciphertext");
  }
  if (!IsValidCiphertext(*public_key_, commitment.a)) {
    throw ProtocolViolation("commitment is not a unit mod n^2");
  }

  BallotEntry ballot;
  ballot.record = VoteRecord{client_id, ciphertext, commitment};
  ballot_index_[client_id] = ballots_.size();
  ballots_.push_back(std::move(ballot));
  cv_.notify_all();
}

bool SessionState::WaitForVotes(size_t count, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout,
                      [this, count]() { return ballots_.size() >= count || shutdown_; }) &&
         ballots_.size() >= count;
}

TallyStart SessionState::BeginTally(const ClientId& requester) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!key_holder_.has_value() || *key_holder_ != requester) {
    throw TallyError("only the key holder may request results");
  }
  if (!public_key_.has_value()) {
    throw TallyError("no shared public key yet");
  }
  if (phase_ >= ServerPhase::kTallying) {
    throw TallyError("tally already started");
  }

  AdvanceLocked(ServerPhase::kTallying);
  TallyStart out;
  out.public_key = *public_key_;
  out.ciphertexts.reserve(ballots_.size());
  for (const BallotEntry& ballot : ballots_) {
    out.ciphertexts.push_back(ballot.record.ciphertext);
  }
  return out;
}

std::vector<ChallengeDispatch> SessionState::IssueChallenges(
    std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mu_);
  if (phase_ != ServerPhase::kTallying) {
    throw std::logic_error("challenges are issued once, right after the tally starts");
  }
  AdvanceLocked(ServerPhase::kChallenging);

  std::vector<ChallengeDispatch> out;
  for (BallotEntry& ballot : ballots_) {
    const auto client = clients_.find(ballot.record.voter_id);
    if (client == clients_.end() || client->second.channel->IsClosed()) {
      ResolveLocked(&ballot, VerificationOutcome::kWithdrawn);
      continue;
    }
    ballot.challenge = SigmaChallenge(*public_key_);
    ballot.deadline = now + challenge_timeout_;
    ++unresolved_challenges_;
    out.push_back(ChallengeDispatch{ballot.record.voter_id, *ballot.challenge,
                                    client->second.channel});
  }
  return out;
}

void SessionState::BeginVerification() {
  std::lock_guard<std::mutex> lock(mu_);
  if (phase_ != ServerPhase::kChallenging) {
    throw std::logic_error("verification starts after challenges are issued");
  }
  AdvanceLocked(ServerPhase::kVerifying);
  MaybeCloseLocked();
}

void SessionState::RecordDecryptedTally(const ClientId& client_id, const mpz_class& tally) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!key_holder_.has_value() || *key_holder_ != client_id) {
    throw ProtocolViolation("only the key holder reports the tally");
  }
  if (phase_ < ServerPhase::kTallying) {
    throw ProtocolViolation("no tally in progress");
  }
  if (decrypted_tally_.has_value()) {
    throw ProtocolViolation("tally already reported");
  }

  decrypted_tally_ = tally;
  if (final_report_.has_value()) {
    final_report_->tally = tally;
    final_report_->tally_outcome = ClassifyTally(tally);
  }
}

bool SessionState::RecordProofResponse(const ClientId& client_id,
                                       const SigmaCommitment& commitment,
                                       const SigmaResponse& response) {
  PaillierPublicKey public_key;
  VoteRecord record;
  mpz_class challenge;
  {
    std::lock_guard<std::mutex> lock(mu_);
    BallotEntry* ballot = FindBallotLocked(client_id);
    if (ballot == nullptr || !ballot->challenge.has_value()) {
      throw ProtocolViolation("no outstanding challenge for " + client_id);
    }
    if (ballot->outcome != VerificationOutcome::kPending || ballot->responding) {
      throw ProtocolViolation("challenge for " + client_id + " is already resolved");
    }
    ballot->responding = true;
    public_key = *public_key_;
    record = ballot->record;
    challenge = *ballot->challenge;
  }

  // The response must open the commitment sent with the vote, not a fresh one.
  const bool valid = commitment.a == record.commitment.a &&
                     SigmaVerify(public_key, record.commitment, response, challenge,
                                 record.ciphertext);

  std::lock_guard<std::mutex> lock(mu_);
  BallotEntry* ballot = FindBallotLocked(client_id);
  if (ballot != nullptr) {
    ResolveLocked(ballot, valid ? VerificationOutcome::kVerified
                                : VerificationOutcome::kProofRejected);
  }
  return valid;
}

void SessionState::MarkDisconnected(const ClientId& client_id) {
  std::lock_guard<std::mutex> lock(mu_);
  clients_.erase(client_id);
  if (key_holder_.has_value() && *key_holder_ == client_id && !public_key_.has_value()) {
    ZKVOTE_LOG(Log(), warning) << "key holder " << client_id
                               << " left before sharing a key; next registrant takes over";
    key_holder_.reset();
  }

  BallotEntry* ballot = FindBallotLocked(client_id);
  if (ballot != nullptr && ballot->challenge.has_value() && !ballot->responding) {
    ResolveLocked(ballot, VerificationOutcome::kWithdrawn);
  }
}

size_t SessionState::ExpireChallenges(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mu_);
  size_t expired = 0;
  for (BallotEntry& ballot : ballots_) {
    if (ballot.challenge.has_value() && ballot.outcome == VerificationOutcome::kPending &&
        !ballot.responding && ballot.deadline <= now) {
      ResolveLocked(&ballot, VerificationOutcome::kTimedOut);
      ++expired;
    }
  }
  return expired;
}

SessionState::BallotEntry* SessionState::FindBallotLocked(const ClientId& client_id) {
  const auto it = ballot_index_.find(client_id);
  if (it == ballot_index_.end()) {
    return nullptr;
  }
  return &ballots_[it->second];
}

void SessionState::ResolveLocked(BallotEntry* ballot, VerificationOutcome outcome) {
  if (ballot->outcome != VerificationOutcome::kPending) {
    return;
  }
  ballot->outcome = outcome;
  if (ballot->challenge.has_value()) {
    --unresolved_challenges_;
  }
  ZKVOTE_LOG(Log(), info) << "voter " << ballot->record.voter_id << ": "
                          << VerificationOutcomeName(outcome);
  MaybeCloseLocked();
}

void SessionState::MaybeCloseLocked() {
  if (phase_ != ServerPhase::kVerifying || unresolved_challenges_ != 0) {
    return;
  }
  final_report_ = BuildReportLocked();
  AdvanceLocked(ServerPhase::kClosed);
}

VerificationReport SessionState::BuildReportLocked() const {
  VerificationReport out;
  out.voters.reserve(ballots_.size());
  for (const BallotEntry& ballot : ballots_) {
    out.voters.push_back(VoterVerification{
        ballot.record.voter_id,
        ballot.outcome == VerificationOutcome::kVerified,
        ballot.outcome,
    });
  }
  if (decrypted_tally_.has_value()) {
    out.tally = *decrypted_tally_;
    out.tally_outcome = ClassifyTally(*decrypted_tally_);
  }
  return out;
}

bool SessionState::IsKeyHolder(const ClientId& client_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return key_holder_.has_value() && *key_holder_ == client_id;
}

size_t SessionState::vote_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ballots_.size();
}

size_t SessionState::registered_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return clients_.size();
}

ServerPhase SessionState::phase() const {
  std::lock_guard<std::mutex> lock(mu_);
  return phase_;
}

VerificationReport SessionState::Report() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (final_report_.has_value()) {
    return *final_report_;
  }
  return BuildReportLocked();
}

void SessionState::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void SessionState::CloseAllChannels() {
  std::vector<std::shared_ptr<MessageChannel>> channels;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [client_id, client] : clients_) {
      (void)client_id;
      channels.push_back(client.channel);
    }
  }
  for (const auto& channel : channels) {
    channel->Close();
  }
}

void SessionState::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!final_report_.has_value()) {
    final_report_ = BuildReportLocked();
  }
  clients_.clear();
  ballots_.clear();
  ballot_index_.clear();
  unresolved_challenges_ = 0;
}

}  // namespace zkvote
