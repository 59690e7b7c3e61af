#include "zkvote/protocol/voter_client.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "zkvote/common/errors.hpp"
#include "zkvote/common/logging.hpp"
#include "zkvote/common/secure_zeroize.hpp"
#include "zkvote/net/tcp_channel.hpp"
#include "zkvote/protocol/messages.hpp"

namespace zkvote {
namespace {

Logger& Log() {
  static Logger logger;
  return logger;
}

ClientConfig Validated(ClientConfig config) {
  ValidateClientConfig(config);
  return config;
}

}  // namespace

const char* ClientStateName(ClientState state) {
  switch (state) {
    case ClientState::kConnecting:
      return "connecting";
    case ClientState::kRoleNegotiation:
      return "role_negotiation";
    case ClientState::kKeyHolder:
      return "key_holder";
    case ClientState::kVoter:
      return "voter";
    case ClientState::kVoting:
      return "voting";
    case ClientState::kAwaitingChallenge:
      return "awaiting_challenge";
    case ClientState::kResponding:
      return "responding";
    case ClientState::kResultDecryption:
      return "result_decryption";
    case ClientState::kClosed:
      return "closed";
  }
  return "unknown";
}

VoterClient::VoterClient(ClientConfig config) : config_(Validated(std::move(config))) {
  outcome_.vote = config_.vote;
}

VoterClient::~VoterClient() {
  WipeSecrets();
}

ClientState VoterClient::state() const {
  return state_;
}

const ClientOutcome& VoterClient::outcome() const {
  return outcome_;
}

ClientOutcome VoterClient::Run(MessageChannel& channel) {
  if (state_ != ClientState::kConnecting) {
    throw std::logic_error("VoterClient::Run may only be called once");
  }

  state_ = ClientState::kRoleNegotiation;
  try {
    NegotiateRole(channel);
    if (outcome_.role == ClientRole::kKeyHolder) {
      state_ = ClientState::kKeyHolder;
      PublishKey(channel);
    } else {
      state_ = ClientState::kVoter;
      ReceiveKey(channel);
    }

    state_ = ClientState::kVoting;
    CastVote(channel);

    if (outcome_.role == ClientRole::kKeyHolder) {
      state_ = ClientState::kResultDecryption;
      RequestTally(channel);
    }

    state_ = ClientState::kAwaitingChallenge;
    AnswerChallenge(channel);
    Complete();
  } catch (const ChannelClosed& ex) {
    Abort(std::string("connection lost: ") + ex.what());
  } catch (const ProtocolViolation& ex) {
    Abort(ex.what());
  } catch (const KeyGenerationError& ex) {
    Abort(std::string("key generation failed: ") + ex.what());
  } catch (const std::exception& ex) {
    Abort(std::string("client failed: ") + ex.what());
  }

  WipeSecrets();
  channel.Close();
  state_ = ClientState::kClosed;

  outcome_.client_id = self_id();
  outcome_.status = status();
  outcome_.abort_reason = abort_reason();
  if (status() == SessionStatus::kCompleted) {
    ZKVOTE_LOG(Log(), info) << self_id() << " done, proof "
                            << (outcome_.proof_accepted.value_or(false) ? "accepted" : "rejected");
  } else {
    ZKVOTE_LOG(Log(), warning) << (self_id().empty() ? std::string("client") : self_id())
                               << " ended " << SessionStatusName(status()) << ": "
                               << abort_reason();
  }
  return outcome_;
}

WireMessage VoterClient::Await(MessageChannel& channel,
                               MessageType expected,
                               std::chrono::milliseconds timeout) {
  std::optional<WireMessage> message =
      ReadWireMessage(channel, timeout, config_.max_message_size);
  if (!message.has_value()) {
    const std::string reason = std::string("timed out waiting for ") + MessageTypeName(expected);
    TimeOut(reason);
    throw ProtocolViolation(reason);
  }
  Touch();

  if (message->type() == MessageType::kError) {
    throw ProtocolViolation(message->GetText("message"));
  }
  RequireMessageType(*message, expected);
  return std::move(*message);
}

void VoterClient::NegotiateRole(MessageChannel& channel) {
  const WireMessage message = Await(channel, MessageType::kClientId, config_.response_timeout);
  AssignIdentity(message.GetText("client_id"));
  outcome_.client_id = self_id();
  outcome_.role = ParseClientRole(message.GetText("role"));
  ZKVOTE_LOG(Log(), info) << "assigned " << self_id() << " as "
                          << ClientRoleName(*outcome_.role);
}

void VoterClient::PublishKey(MessageChannel& channel) {
  if (config_.prime_bits.has_value()) {
    key_pair_ = GeneratePaillierKeyPairBits(*config_.prime_bits);
  } else {
    key_pair_ = GeneratePaillierKeyPair(config_.key_range);
  }
  public_key_ = key_pair_->public_key;
  ZKVOTE_LOG(Log(), debug) << self_id() << " generated Paillier key, n = "
                           << public_key_->n.get_str();

  SendWireMessage(channel, MakePublicKeyMessage(*public_key_));
  Await(channel, MessageType::kFirstClientConfirmed, config_.response_timeout);
}

void VoterClient::ReceiveKey(MessageChannel& channel) {
  const WireMessage message =
      Await(channel, MessageType::kSharedPublicKey, config_.response_timeout);
  public_key_ = ReadPublicKey(message);
}

void VoterClient::CastVote(MessageChannel& channel) {
  const PaillierProvider provider(*public_key_);
  const mpz_class plaintext = VoteValue(config_.vote);

  PaillierCiphertextWithRandom encrypted = provider.EncryptWithRandom(plaintext);
  SigmaCommitResult commit = SigmaCommit(*public_key_);
  witness_ = ProverWitness{plaintext, encrypted.randomness, commit.nonce, commit.commitment};
  SecureZeroize(&encrypted.randomness);
  SecureZeroize(&commit.nonce);

  SendWireMessage(channel, MakeVoteMessage(encrypted.ciphertext, witness_->commitment));
  Await(channel, MessageType::kVoteReceived, config_.response_timeout);
  outcome_.vote_acknowledged = true;
}

void VoterClient::RequestTally(MessageChannel& channel) {
  if (config_.tally_gate) {
    config_.tally_gate();
  }

  SendWireMessage(channel, MakeGetResultsMessage());
  const WireMessage message = Await(channel, MessageType::kEncryptedSum, config_.response_timeout);

  // A bad sum costs the tally, not the proof round.
  try {
    const mpz_class tally = PaillierDecrypt(*key_pair_, message.GetInteger("encrypted_sum"));
    outcome_.tally = tally;
    outcome_.tally_outcome = ClassifyTally(tally);
    SendWireMessage(channel, MakeDecryptedResultMessage(tally));
    ZKVOTE_LOG(Log(), info) << "tally " << tally.get_str() << ": "
                            << TallyOutcomeName(*outcome_.tally_outcome);
  } catch (const DecryptionError& ex) {
    outcome_.decryption_error = ex.what();
    ZKVOTE_LOG(Log(), error) << "cannot decrypt the encrypted sum: " << ex.what();
  }
}

void VoterClient::AnswerChallenge(MessageChannel& channel) {
  const WireMessage challenge_message =
      Await(channel, MessageType::kZkpChallenge, config_.challenge_timeout);
  state_ = ClientState::kResponding;

  const mpz_class& challenge = challenge_message.GetInteger("challenge");
  if (challenge < 1 || challenge >= public_key_->n) {
    throw ProtocolViolation("challenge outside [1, n)");
  }
  if (!witness_.has_value()) {
    throw std::logic_error("challenge received without a cast vote");
  }

  mpz_class plaintext = witness_->plaintext;
  if (config_.proof_mode == ProofMode::kFlipVote) {
    plaintext = VoteValue(OppositeVote(config_.vote));
  }
  const SigmaResponse response =
      SigmaRespond(*public_key_, witness_->nonce, challenge, plaintext, witness_->randomness);
  SecureZeroize(&plaintext);

  SendWireMessage(channel, MakeZkpResponseMessage(witness_->commitment, response));
  const WireMessage result = Await(channel, MessageType::kZkpResult, config_.response_timeout);
  outcome_.proof_accepted = result.GetBool("valid");
}

void VoterClient::WipeSecrets() {
  SecureZeroize(&witness_);
  if (key_pair_.has_value()) {
    SecureZeroize(&key_pair_->private_key.p);
    SecureZeroize(&key_pair_->private_key.q);
    SecureZeroize(&key_pair_->private_key.lambda);
    SecureZeroize(&key_pair_->private_key.mu);
    key_pair_.reset();
  }
}

ClientOutcome RunVoterClient(const ClientConfig& config) {
  VoterClient client(config);
  std::unique_ptr<TcpChannel> channel =
      ConnectTcp(config.host, config.port, config.connect_timeout, config.max_message_size);
  return client.Run(*channel);
}

}  // namespace zkvote
