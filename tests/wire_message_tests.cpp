#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gmpxx.h>

#include "zkvote/common/errors.hpp"
#include "zkvote/crypto/paillier.hpp"
#include "zkvote/net/channel.hpp"
#include "zkvote/net/in_memory_channel.hpp"
#include "zkvote/net/tcp_channel.hpp"
#include "zkvote/net/wire_message.hpp"
#include "zkvote/protocol/messages.hpp"

namespace {

using namespace std::chrono_literals;

using zkvote::DecodeWireMessage;
using zkvote::EncodeWireMessage;
using zkvote::InMemoryChannel;
using zkvote::MessageType;
using zkvote::WireMessage;

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

void ExpectViolation(const std::string& line, const std::string& message) {
  try {
    (void)DecodeWireMessage(line);
  } catch (const zkvote::ProtocolViolation&) {
    return;
  } catch (const std::exception& ex) {
    throw std::runtime_error("Wrong exception for " + message + ": " + ex.what());
  }
  throw std::runtime_error("Expected ProtocolViolation: " + message);
}

void TestEncodeLayout() {
  mpz_class big("123456789012345678901234567890123456789");
  WireMessage vote(MessageType::kVote);
  vote.SetInteger("encrypted_vote", big).SetInteger("commitment", 17);
  Expect(EncodeWireMessage(vote) ==
             "{\"type\":\"vote\",\"encrypted_vote\":123456789012345678901234567890123456789,"
             "\"commitment\":17}",
         "type first, integers as bare decimals, insertion order kept");

  const WireMessage key = zkvote::MakePublicKeyMessage(zkvote::PaillierPublicKey{3128, 3127});
  Expect(EncodeWireMessage(key) == "{\"type\":\"public_key\",\"public_key\":[3128,3127]}",
         "public keys are [g, n] arrays");

  Expect(EncodeWireMessage(zkvote::MakeZkpResultMessage(false)) ==
             "{\"type\":\"zkp_result\",\"valid\":false}",
         "booleans are JSON literals");
  Expect(EncodeWireMessage(zkvote::MakeGetResultsMessage()) == "{\"type\":\"get_results\"}",
         "field-less messages carry only the tag");
  Expect(EncodeWireMessage(zkvote::MakeErrorMessage("bad \"x\"\n")) ==
             "{\"type\":\"error\",\"message\":\"bad \\\"x\\\"\\n\"}",
         "strings are escaped");

  ExpectThrow([]() { (void)EncodeWireMessage(WireMessage()); }, "untyped messages cannot encode");
  ExpectThrow([]() { WireMessage(MessageType::kVote).SetText("type", "vote"); },
              "the type key is reserved");
}

void TestDecodeAcceptsWellFormed() {
  const WireMessage decoded = DecodeWireMessage(
      " { \"commitment\" : 99 , \"type\" : \"vote\", \"encrypted_vote\": -5 } ");
  Expect(decoded.type() == MessageType::kVote, "type may appear anywhere");
  Expect(decoded.GetInteger("encrypted_vote") == -5, "negative integers decode");
  Expect(decoded.GetInteger("commitment") == 99, "whitespace around tokens is allowed");
  Expect(decoded.field_count() == 2, "type is not a field");

  const WireMessage id = DecodeWireMessage(
      "{\"type\":\"client_id\",\"client_id\":\"C\\u0031234\",\"role\":\"voter\"}");
  Expect(id.GetText("client_id") == "C1234", "ASCII unicode escapes decode");

  // As a json.dumps peer with ensure_ascii emits it.
  const WireMessage error = DecodeWireMessage(
      "{\"type\": \"error\", \"message\": \"caf\\u00e9\", \"extra\": null}");
  Expect(error.GetText("message") == "caf\xc3\xa9", "non-ASCII escapes decode to UTF-8");
  Expect(!error.Has("extra") && error.field_count() == 1, "null fields are dropped");

  const WireMessage wide = DecodeWireMessage(
      "{\"type\":\"encrypted_sum\",\"encrypted_sum\":\"123456789012345678901234567890\"}");
  Expect(wide.GetInteger("encrypted_sum") == mpz_class("123456789012345678901234567890"),
         "decimal strings read as integers");

  const WireMessage key = DecodeWireMessage("{\"type\":\"shared_public_key\",\"public_key\":[ ]}");
  Expect(key.GetIntegerList("public_key").empty(), "empty arrays decode");
  ExpectThrow([&]() { (void)zkvote::ReadPublicKey(key); }, "a key needs exactly two entries");

  const WireMessage result = DecodeWireMessage("{\"type\":\"zkp_result\",\"valid\":true}");
  Expect(result.GetBool("valid"), "boolean literals decode");

  mpz_class huge = 1;
  huge <<= 4096;
  WireMessage sum(MessageType::kEncryptedSum);
  sum.SetInteger("encrypted_sum", huge);
  const std::string encoded_sum = EncodeWireMessage(sum);
  Expect(encoded_sum.rfind("{\"type\":\"encrypted_sum\",\"encrypted_sum\":\"", 0) == 0,
         "integers wider than a double's range travel as decimal strings");
  Expect(DecodeWireMessage(encoded_sum).GetInteger("encrypted_sum") == huge,
         "4096-bit integers survive the codec");

  const WireMessage key_list = DecodeWireMessage(EncodeWireMessage(
      WireMessage(MessageType::kSharedPublicKey).SetIntegerList("public_key", {mpz_class(huge + 1), huge})));
  Expect(key_list.GetIntegerList("public_key").size() == 2 &&
             key_list.GetIntegerList("public_key")[1] == huge,
         "wide integers inside arrays survive the codec");

  const WireMessage mid = DecodeWireMessage(
      "{\"type\":\"zkp_challenge\",\"challenge\":123456789012345678901234567890123}");
  Expect(mid.GetInteger("challenge") == mpz_class("123456789012345678901234567890123"),
         "bare numbers beyond 64 bits keep every digit");
}

void TestDecodeRejectsMalformed() {
  ExpectViolation("", "empty line");
  ExpectViolation("[]", "top level must be an object");
  ExpectViolation("{}", "type is mandatory");
  ExpectViolation("{\"type\":\"ballot\"}", "unknown type");
  ExpectViolation("{\"type\":7}", "type must be a string");
  ExpectViolation("{\"type\":\"vote\",\"type\":\"vote\"}", "duplicate type");
  ExpectViolation("{\"type\":\"vote\",\"a\":1,\"a\":2}", "duplicate field");
  ExpectViolation("{\"type\":\"vote\",\"a\":01}", "leading zero");
  ExpectViolation("{\"type\":\"vote\",\"a\":1.5}", "fractions");
  ExpectViolation("{\"type\":\"vote\",\"a\":1e5}", "exponents");
  ExpectViolation("{\"type\":\"vote\",\"a\":{}}", "nested objects");
  ExpectViolation("{\"type\":\"vote\",\"a\":[\"x\"]}", "arrays hold integers only");
  ExpectViolation("{\"type\":\"vote\",\"a\":[[1]]}", "nested arrays");
  ExpectViolation("{\"type\":\"vote\",\"a\":[1.5]}", "fractions inside arrays");
  ExpectViolation("{\"type\":null}", "null type");
  ExpectViolation("7", "top-level scalar");
  ExpectViolation("{\"type\":\"vote\",\"a\":\"\\q\"}", "unknown escapes");
  ExpectViolation("{\"type\":\"vote\",\"a\":\"open}", "unterminated string");
  ExpectViolation("{\"type\":\"vote\",}", "trailing comma");
  ExpectViolation("{\"type\":\"vote\"} x", "trailing bytes");
  ExpectViolation("{\"type\":\"vote\"}{\"type\":\"vote\"}", "two records on one line");

  const std::string oversized = "{\"type\":\"error\",\"message\":\"" + std::string(200, 'x') + "\"}";
  try {
    (void)DecodeWireMessage(oversized, 64);
    throw std::runtime_error("Expected ProtocolViolation: line over max length");
  } catch (const zkvote::ProtocolViolation&) {
  }
}

void TestFieldAccessors() {
  const WireMessage message = DecodeWireMessage(
      "{\"type\":\"zkp_response\",\"u\":5,\"v\":\"six\",\"w\":[7]}");
  Expect(message.GetInteger("u") == 5, "integer field");
  Expect(message.Has("v") && !message.Has("x"), "Has reports presence");

  const auto expect_violation = [&](const std::function<void()>& fn, const std::string& what) {
    try {
      fn();
    } catch (const zkvote::ProtocolViolation&) {
      return;
    }
    throw std::runtime_error("Expected ProtocolViolation: " + what);
  };
  expect_violation([&]() { (void)message.GetInteger("v"); }, "non-decimal string read as integer");
  expect_violation([&]() { (void)message.GetInteger("w"); }, "array read as integer");
  expect_violation([&]() { (void)message.GetText("u"); }, "integer read as string");
  expect_violation([&]() { (void)message.GetBool("u"); }, "integer read as boolean");
  expect_violation([&]() { (void)message.GetInteger("x"); }, "missing field");
  expect_violation(
      [&]() {
        zkvote::SigmaCommitment commitment;
        (void)zkvote::ReadZkpResponse(message, &commitment);
      },
      "malformed zkp_response");

  expect_violation(
      [&]() {
        (void)zkvote::ReadPublicKey(
            DecodeWireMessage("{\"type\":\"public_key\",\"public_key\":[10,10]}"));
      },
      "g must be n + 1");
  expect_violation(
      [&]() { zkvote::RequireMessageType(message, MessageType::kVote); }, "type mismatch");
}

void TestMessageTypeNames() {
  const std::vector<MessageType> types = {
      MessageType::kPublicKey,       MessageType::kVote,
      MessageType::kGetResults,      MessageType::kDecryptedResult,
      MessageType::kZkpResponse,     MessageType::kClientId,
      MessageType::kSharedPublicKey, MessageType::kFirstClientConfirmed,
      MessageType::kVoteReceived,    MessageType::kEncryptedSum,
      MessageType::kZkpChallenge,    MessageType::kZkpResult,
      MessageType::kError};
  for (MessageType type : types) {
    Expect(zkvote::ParseMessageType(zkvote::MessageTypeName(type)) == type,
           std::string("name round-trip for ") + zkvote::MessageTypeName(type));
  }
  Expect(zkvote::ParseMessageType("nope") == MessageType::kUnknown, "unknown names map to kUnknown");
}

void TestInMemoryChannel() {
  auto pair = InMemoryChannel::CreatePair();
  std::shared_ptr<InMemoryChannel> client = pair.first;
  std::shared_ptr<InMemoryChannel> server = pair.second;
  Expect(!client->ReadLine(10ms).has_value(), "an idle channel times out");

  zkvote::SendWireMessage(*client, zkvote::MakeGetResultsMessage());
  zkvote::SendWireMessage(*client, zkvote::MakeDecryptedResultMessage(-3));
  const auto first = zkvote::ReadWireMessage(*server, 100ms);
  const auto second = zkvote::ReadWireMessage(*server, 100ms);
  Expect(first.has_value() && first->type() == MessageType::kGetResults, "FIFO order (1)");
  Expect(second.has_value() && second->GetInteger("result") == -3, "FIFO order (2)");

  std::thread writer([peer = server]() {
    std::this_thread::sleep_for(20ms);
    peer->SendLine("{\"type\":\"vote_received\"}");
  });
  const auto woken = zkvote::ReadWireMessage(*client, 2000ms);
  writer.join();
  Expect(woken.has_value() && woken->type() == MessageType::kVoteReceived,
         "a blocked reader wakes on delivery");

  server->SendLine("{\"type\":\"vote_received\"}");
  server->Close();
  Expect(client->IsClosed(), "closing one end closes the link");
  Expect(client->ReadLine(10ms).has_value(), "lines sent before close stay readable");
  ExpectThrow([&]() { (void)client->ReadLine(10ms); }, "reading a drained closed link throws");
  ExpectThrow([&]() { client->SendLine("{}"); }, "writing to a closed link throws");
}

void TestTcpLoopback() {
  zkvote::TcpListener listener("127.0.0.1", 0);
  Expect(listener.port() != 0, "an ephemeral port is bound");
  Expect(listener.Accept(10ms) == nullptr, "accept times out without a peer");

  auto client = zkvote::ConnectTcp("127.0.0.1", listener.port(), 2000ms, /*max_line_len=*/256);
  std::unique_ptr<zkvote::TcpChannel> server;
  for (int i = 0; i < 50 && !server; ++i) {
    server = listener.Accept(100ms, /*max_line_len=*/256);
  }
  Expect(server != nullptr, "the listener accepts the connection");

  zkvote::SendWireMessage(*client, zkvote::MakeZkpChallengeMessage(mpz_class("98765432109876")));
  const auto challenge = zkvote::ReadWireMessage(*server, 2000ms);
  Expect(challenge.has_value() && challenge->GetInteger("challenge") == mpz_class("98765432109876"),
         "records cross the socket intact");

  client->SendLine("{\"type\":\"vote_received\"}\r");
  const auto crlf = zkvote::ReadWireMessage(*server, 2000ms);
  Expect(crlf.has_value() && crlf->type() == MessageType::kVoteReceived,
         "a trailing carriage return is tolerated");

  client->SendLine(std::string(400, 'x'));
  try {
    (void)server->ReadLine(2000ms);
    throw std::runtime_error("Expected ProtocolViolation: oversized line on the socket");
  } catch (const zkvote::ProtocolViolation&) {
  }

  client->Close();
  ExpectThrow(
      [&]() {
        for (int i = 0; i < 50; ++i) {
          (void)server->ReadLine(100ms);
        }
      },
      "peer close surfaces as ChannelClosed");
}

}  // namespace

int main() {
  try {
    TestEncodeLayout();
    TestDecodeAcceptsWellFormed();
    TestDecodeRejectsMalformed();
    TestFieldAccessors();
    TestMessageTypeNames();
    TestInMemoryChannel();
    TestTcpLoopback();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Wire message tests passed" << '\n';
  return 0;
}
