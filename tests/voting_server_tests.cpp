#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gmpxx.h>

#include "zkvote/common/logging.hpp"
#include "zkvote/crypto/paillier.hpp"
#include "zkvote/crypto/sigma_proof.hpp"
#include "zkvote/net/in_memory_channel.hpp"
#include "zkvote/net/wire_message.hpp"
#include "zkvote/protocol/config.hpp"
#include "zkvote/protocol/messages.hpp"
#include "zkvote/protocol/session_state.hpp"
#include "zkvote/protocol/types.hpp"
#include "zkvote/protocol/voting_server.hpp"

namespace {

using namespace std::chrono_literals;

using zkvote::ClientRole;
using zkvote::InMemoryChannel;
using zkvote::MessageType;
using zkvote::PaillierKeyPair;
using zkvote::PaillierProvider;
using zkvote::ServerConfig;
using zkvote::ServerPhase;
using zkvote::VotingServer;
using zkvote::WireMessage;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

ServerConfig InProcessServerConfig() {
  ServerConfig config;
  config.port = 0;
  config.key_exchange_timeout = 2000ms;
  config.challenge_response_timeout = 2000ms;
  config.idle_timeout = 5000ms;
  config.poll_interval = 20ms;
  return config;
}

// One client connection served by VotingServer::ServeConnection on its own thread; the test
// body speaks for the client on the other end.
class ServedConnection {
 public:
  explicit ServedConnection(VotingServer* server) {
    auto pair = InMemoryChannel::CreatePair();
    client_end_ = pair.first;
    std::shared_ptr<InMemoryChannel> server_end = pair.second;
    thread_ = std::thread([server, server_end]() { server->ServeConnection(server_end); });
  }

  ~ServedConnection() {
    client_end_->Close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void Send(const WireMessage& message) {
    zkvote::SendWireMessage(*client_end_, message);
  }

  WireMessage Receive(MessageType expected) {
    const std::optional<WireMessage> message = zkvote::ReadWireMessage(*client_end_, 2000ms);
    Expect(message.has_value(), std::string("server never sent ") + zkvote::MessageTypeName(expected));
    Expect(message->type() == expected, std::string("expected ") +
                                            zkvote::MessageTypeName(expected) + ", got " +
                                            zkvote::MessageTypeName(message->type()));
    return *message;
  }

  // The server closes a dropped connection right after its error reply.
  bool WaitForClose(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (client_end_->IsClosed()) {
        return true;
      }
      std::this_thread::sleep_for(10ms);
    }
    return client_end_->IsClosed();
  }

  bool IsClosed() const {
    return client_end_->IsClosed();
  }

 private:
  std::shared_ptr<InMemoryChannel> client_end_;
  std::thread thread_;
};

// Connects the key holder and publishes its key; leaves the server collecting votes.
std::unique_ptr<ServedConnection> ConnectKeyHolder(VotingServer* server,
                                                   const PaillierKeyPair& key_pair) {
  auto key_holder = std::make_unique<ServedConnection>(server);
  const WireMessage id = key_holder->Receive(MessageType::kClientId);
  Expect(id.GetText("role") == zkvote::ClientRoleName(ClientRole::kKeyHolder),
         "first connection is the key holder");
  key_holder->Send(zkvote::MakePublicKeyMessage(key_pair.public_key));
  key_holder->Receive(MessageType::kFirstClientConfirmed);
  return key_holder;
}

std::unique_ptr<ServedConnection> ConnectVoter(VotingServer* server) {
  auto voter = std::make_unique<ServedConnection>(server);
  const WireMessage id = voter->Receive(MessageType::kClientId);
  Expect(id.GetText("role") == zkvote::ClientRoleName(ClientRole::kVoter),
         "later connections are voters");
  voter->Receive(MessageType::kSharedPublicKey);
  return voter;
}

WireMessage ValidVote(const PaillierKeyPair& key_pair) {
  const PaillierProvider paillier(key_pair.public_key);
  const mpz_class ciphertext = paillier.EncryptWithRandom(1).ciphertext;
  return zkvote::MakeVoteMessage(ciphertext, zkvote::SigmaCommit(key_pair.public_key).commitment);
}

void TestVoterResultsRequestRefused() {
  const PaillierKeyPair key_pair = zkvote::BuildPaillierKeyPair(53, 59);
  VotingServer server(InProcessServerConfig());
  auto key_holder = ConnectKeyHolder(&server, key_pair);
  auto voter = ConnectVoter(&server);

  voter->Send(zkvote::MakeGetResultsMessage());
  const WireMessage refusal = voter->Receive(MessageType::kError);
  Expect(refusal.GetText("message").find("only the key holder") != std::string::npos,
         "refusal names the key holder");
  Expect(!voter->IsClosed(), "refused voter stays connected");

  voter->Send(ValidVote(key_pair));
  voter->Receive(MessageType::kVoteReceived);
  Expect(server.state().phase() == ServerPhase::kCollecting, "tally did not start");

  server.RequestShutdown();
}

void TestMalformedVoteDropsOnlySender() {
  const PaillierKeyPair key_pair = zkvote::BuildPaillierKeyPair(53, 59);
  VotingServer server(InProcessServerConfig());
  auto key_holder = ConnectKeyHolder(&server, key_pair);
  auto offender = ConnectVoter(&server);
  auto bystander = ConnectVoter(&server);

  WireMessage malformed(MessageType::kVote);
  malformed.SetInteger("encrypted_vote", 4);
  offender->Send(malformed);
  const WireMessage error = offender->Receive(MessageType::kError);
  Expect(error.GetText("message").find("commitment") != std::string::npos,
         "error names the missing field");
  Expect(offender->WaitForClose(2000ms), "offending voter is disconnected");

  Expect(!key_holder->IsClosed(), "key holder keeps its connection");
  Expect(!bystander->IsClosed(), "other voter keeps its connection");
  Expect(server.state().phase() == ServerPhase::kCollecting, "election keeps collecting");

  bystander->Send(ValidVote(key_pair));
  bystander->Receive(MessageType::kVoteReceived);

  server.RequestShutdown();
}

void TestOutOfPhaseMessageDropsOnlySender() {
  const PaillierKeyPair key_pair = zkvote::BuildPaillierKeyPair(53, 59);
  VotingServer server(InProcessServerConfig());
  auto key_holder = ConnectKeyHolder(&server, key_pair);
  auto offender = ConnectVoter(&server);

  offender->Send(zkvote::MakePublicKeyMessage(key_pair.public_key));
  const WireMessage error = offender->Receive(MessageType::kError);
  Expect(error.GetText("message").find("unexpected public_key") != std::string::npos,
         "error names the unexpected message");
  Expect(offender->WaitForClose(2000ms), "offending voter is disconnected");
  Expect(!key_holder->IsClosed(), "key holder keeps its connection");

  auto late_voter = ConnectVoter(&server);
  late_voter->Send(ValidVote(key_pair));
  late_voter->Receive(MessageType::kVoteReceived);
  Expect(server.state().phase() == ServerPhase::kCollecting, "election keeps collecting");

  server.RequestShutdown();
}

}  // namespace

int main() {
  try {
    zkvote::InitLogging(boost::log::trivial::error);
    TestVoterResultsRequestRefused();
    TestMalformedVoteDropsOnlySender();
    TestOutOfPhaseMessageDropsOnlySender();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Voting server tests passed" << '\n';
  return 0;
}
