#include "zkvote/protocol/voting_server.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include "zkvote/common/errors.hpp"
#include "zkvote/common/logging.hpp"
#include "zkvote/crypto/paillier.hpp"
#include "zkvote/protocol/messages.hpp"

namespace zkvote {
namespace {

Logger& Log() {
  static Logger logger;
  return logger;
}

ServerConfig Validated(ServerConfig config) {
  ValidateServerConfig(config);
  return config;
}

void SendErrorBestEffort(MessageChannel& channel, const std::string& text) {
  try {
    SendWireMessage(channel, MakeErrorMessage(text));
  } catch (const ChannelClosed& ex) {
    ZKVOTE_LOG(Log(), debug) << "error reply to " << channel.peer_label()
                             << " not delivered: " << ex.what();
  }
}

}  // namespace

VotingServer::VotingServer(ServerConfig config)
    : config_(Validated(std::move(config))), state_(config_) {}

VotingServer::~VotingServer() {
  RequestShutdown();
  state_.Shutdown();
  state_.CloseAllChannels();
  workers_.JoinAll();
}

void VotingServer::Start() {
  if (listener_) {
    return;
  }
  listener_ = std::make_unique<TcpListener>(config_.host, config_.port);
  ZKVOTE_LOG(Log(), info) << "listening on " << config_.host << ":" << listener_->port();
}

void VotingServer::Run() {
  Start();

  while (!shutdown_requested_.load()) {
    std::unique_ptr<TcpChannel> accepted =
        listener_->Accept(config_.poll_interval, config_.max_message_size);
    if (accepted) {
      std::shared_ptr<MessageChannel> channel(std::move(accepted));
      ZKVOTE_LOG(Log(), debug) << "accepted " << channel->peer_label();
      workers_.Spawn([this, channel]() { ServeConnection(channel); });
    }

    const size_t expired = state_.ExpireChallenges();
    if (expired > 0) {
      ZKVOTE_LOG(Log(), warning) << expired << " challenge(s) expired unanswered";
    }
    if (config_.shutdown_on_completion && state_.phase() == ServerPhase::kClosed) {
      ZKVOTE_LOG(Log(), info) << "all proofs resolved, shutting down";
      RequestShutdown();
    }
  }

  listener_->Close();
  DrainWorkers();
  state_.Clear();

  const VerificationReport report = state_.Report();
  ZKVOTE_LOG(Log(), info) << "election closed: " << report.voters.size() << " vote(s), "
                          << report.fraud_count() << " rejected proof(s)";
  if (report.tally.has_value()) {
    ZKVOTE_LOG(Log(), info) << "tally " << report.tally->get_str() << " ("
                            << TallyOutcomeName(*report.tally_outcome) << ")";
  }
}

void VotingServer::DrainWorkers() {
  state_.Shutdown();
  const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_grace_period;
  while (workers_.active_count() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  state_.CloseAllChannels();
  workers_.JoinAll();
}

void VotingServer::RequestShutdown() {
  shutdown_requested_.store(true);
}

bool VotingServer::shutdown_requested() const {
  return shutdown_requested_.load();
}

uint16_t VotingServer::port() const {
  return listener_ ? listener_->port() : config_.port;
}

SessionState& VotingServer::state() {
  return state_;
}

const SessionState& VotingServer::state() const {
  return state_;
}

VerificationReport VotingServer::report() const {
  return state_.Report();
}

std::optional<WireMessage> VotingServer::ReadFromClient(MessageChannel& channel,
                                                        std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!shutdown_requested_.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    const auto slice = std::min(
        config_.poll_interval, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (std::optional<WireMessage> message =
            ReadWireMessage(channel, slice, config_.max_message_size)) {
      return message;
    }
  }
  return std::nullopt;
}

void VotingServer::ServeConnection(std::shared_ptr<MessageChannel> channel) {
  Registration registration;
  try {
    registration = state_.Register(channel);
  } catch (const SessionClosedError& ex) {
    ZKVOTE_LOG(Log(), info) << "rejecting " << channel->peer_label() << ": " << ex.what();
    SendErrorBestEffort(*channel, ex.what());
    channel->Close();
    return;
  }

  const ClientId& client_id = registration.client_id;
  ZKVOTE_LOG(Log(), info) << "registered " << client_id << " as "
                          << ClientRoleName(registration.role) << " from "
                          << channel->peer_label();

  try {
    SendWireMessage(*channel, MakeClientIdMessage(client_id, registration.role));
    ExchangeKey(*channel, registration);

    while (!shutdown_requested_.load()) {
      std::optional<WireMessage> message = ReadFromClient(*channel, config_.idle_timeout);
      if (!message.has_value()) {
        if (shutdown_requested_.load()) {
          break;
        }
        throw ProtocolViolation("idle timeout");
      }

      switch (message->type()) {
        case MessageType::kVote:
          state_.RecordVote(client_id, message->GetInteger("encrypted_vote"),
                            SigmaCommitment{message->GetInteger("commitment")});
          SendWireMessage(*channel, MakeVoteReceivedMessage());
          ZKVOTE_LOG(Log(), info) << "vote stored for " << client_id;
          break;
        case MessageType::kGetResults:
          try {
            HandleGetResults(*channel, client_id);
          } catch (const TallyError& ex) {
            ZKVOTE_LOG(Log(), warning) << "get_results from " << client_id
                                       << " refused: " << ex.what();
            SendWireMessage(*channel, MakeErrorMessage(ex.what()));
          }
          break;
        case MessageType::kDecryptedResult: {
          const mpz_class& tally = message->GetInteger("result");
          state_.RecordDecryptedTally(client_id, tally);
          ZKVOTE_LOG(Log(), info) << "key holder reports tally " << tally.get_str() << " ("
                                  << TallyOutcomeName(ClassifyTally(tally)) << ")";
          break;
        }
        case MessageType::kZkpResponse: {
          SigmaCommitment commitment;
          const SigmaResponse response = ReadZkpResponse(*message, &commitment);
          const bool valid = state_.RecordProofResponse(client_id, commitment, response);
          SendWireMessage(*channel, MakeZkpResultMessage(valid));
          if (!valid) {
            ZKVOTE_LOG(Log(), warning) << "proof from " << client_id << " rejected";
          }
          break;
        }
        default:
          throw ProtocolViolation(std::string("unexpected ") + MessageTypeName(message->type()) +
                                  " message");
      }
    }
  } catch (const ChannelClosed& ex) {
    ZKVOTE_LOG(Log(), debug) << client_id << " disconnected: " << ex.what();
  } catch (const ProtocolViolation& ex) {
    ZKVOTE_LOG(Log(), warning) << "dropping " << client_id << ": " << ex.what();
    SendErrorBestEffort(*channel, ex.what());
  } catch (const std::exception& ex) {
    ZKVOTE_LOG(Log(), error) << "connection " << client_id << " failed: " << ex.what();
    SendErrorBestEffort(*channel, "internal server error");
  }

  state_.MarkDisconnected(client_id);
  channel->Close();
}

void VotingServer::ExchangeKey(MessageChannel& channel, const Registration& registration) {
  if (registration.role == ClientRole::kKeyHolder) {
    std::optional<WireMessage> message = ReadFromClient(channel, config_.key_exchange_timeout);
    if (!message.has_value()) {
      if (shutdown_requested_.load()) {
        throw SessionClosedError("server shutting down");
      }
      throw ProtocolViolation("timed out waiting for public_key");
    }
    RequireMessageType(*message, MessageType::kPublicKey);
    const PaillierPublicKey public_key = ReadPublicKey(*message);
    state_.PublishPublicKey(registration.client_id, public_key);
    SendWireMessage(channel, MakeFirstClientConfirmedMessage());
    ZKVOTE_LOG(Log(), info) << "public key published by " << registration.client_id
                            << " (n has " << mpz_sizeinbase(public_key.n.get_mpz_t(), 2)
                            << " bits)";
    return;
  }

  const std::optional<PaillierPublicKey> public_key =
      state_.WaitForPublicKey(config_.key_exchange_timeout);
  if (!public_key.has_value()) {
    if (shutdown_requested_.load()) {
      throw SessionClosedError("server shutting down");
    }
    throw ProtocolViolation("no public key available from the key holder");
  }
  SendWireMessage(channel, MakeSharedPublicKeyMessage(*public_key));
}

void VotingServer::HandleGetResults(MessageChannel& channel, const ClientId& client_id) {
  const TallyStart start = state_.BeginTally(client_id);
  ZKVOTE_LOG(Log(), info) << "tallying " << start.ciphertexts.size() << " vote(s)";

  const PaillierProvider provider(start.public_key);
  const mpz_class encrypted_sum = provider.SumCiphertexts(start.ciphertexts);

  bool requester_gone = false;
  try {
    SendWireMessage(channel, MakeEncryptedSumMessage(encrypted_sum));
  } catch (const ChannelClosed& ex) {
    ZKVOTE_LOG(Log(), warning) << "key holder " << client_id << " left during the tally: "
                               << ex.what();
    requester_gone = true;
  }

  // Challenges go out even if the key holder left; every ballot still gets verified.
  for (const ChallengeDispatch& dispatch : state_.IssueChallenges()) {
    try {
      SendWireMessage(*dispatch.channel, MakeZkpChallengeMessage(dispatch.challenge));
    } catch (const ChannelClosed& ex) {
      ZKVOTE_LOG(Log(), info) << "challenge for " << dispatch.voter_id
                              << " not delivered: " << ex.what();
      state_.MarkDisconnected(dispatch.voter_id);
    }
  }
  state_.BeginVerification();

  if (requester_gone) {
    throw ChannelClosed("key holder disconnected during the tally");
  }
}

}  // namespace zkvote
