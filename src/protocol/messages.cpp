#include "zkvote/protocol/messages.hpp"

#include <stdexcept>
#include <vector>

#include "zkvote/common/errors.hpp"

namespace zkvote {
namespace {

constexpr char kPublicKeyField[] = "public_key";

std::vector<mpz_class> PublicKeyToList(const PaillierPublicKey& public_key) {
  return {public_key.g, public_key.n};
}

}  // namespace

WireMessage MakePublicKeyMessage(const PaillierPublicKey& public_key) {
  WireMessage out(MessageType::kPublicKey);
  out.SetIntegerList(kPublicKeyField, PublicKeyToList(public_key));
  return out;
}

WireMessage MakeVoteMessage(const mpz_class& encrypted_vote, const SigmaCommitment& commitment) {
  WireMessage out(MessageType::kVote);
  out.SetInteger("encrypted_vote", encrypted_vote).SetInteger("commitment", commitment.a);
  return out;
}

WireMessage MakeGetResultsMessage() {
  return WireMessage(MessageType::kGetResults);
}

WireMessage MakeDecryptedResultMessage(const mpz_class& result) {
  WireMessage out(MessageType::kDecryptedResult);
  out.SetInteger("result", result);
  return out;
}

WireMessage MakeZkpResponseMessage(const SigmaCommitment& commitment,
                                   const SigmaResponse& response) {
  WireMessage out(MessageType::kZkpResponse);
  out.SetInteger("u", commitment.a).SetInteger("v", response.v).SetInteger("w", response.w);
  return out;
}

WireMessage MakeClientIdMessage(const ClientId& client_id, ClientRole role) {
  WireMessage out(MessageType::kClientId);
  out.SetText("client_id", client_id).SetText("role", ClientRoleName(role));
  return out;
}

WireMessage MakeSharedPublicKeyMessage(const PaillierPublicKey& public_key) {
  WireMessage out(MessageType::kSharedPublicKey);
  out.SetIntegerList(kPublicKeyField, PublicKeyToList(public_key));
  return out;
}

WireMessage MakeFirstClientConfirmedMessage() {
  return WireMessage(MessageType::kFirstClientConfirmed);
}

WireMessage MakeVoteReceivedMessage() {
  return WireMessage(MessageType::kVoteReceived);
}

WireMessage MakeEncryptedSumMessage(const mpz_class& encrypted_sum) {
  WireMessage out(MessageType::kEncryptedSum);
  out.SetInteger("encrypted_sum", encrypted_sum);
  return out;
}

WireMessage MakeZkpChallengeMessage(const mpz_class& challenge) {
  WireMessage out(MessageType::kZkpChallenge);
  out.SetInteger("challenge", challenge);
  return out;
}

WireMessage MakeZkpResultMessage(bool valid) {
  WireMessage out(MessageType::kZkpResult);
  out.SetBool("valid", valid);
  return out;
}

WireMessage MakeErrorMessage(const std::string& text) {
  WireMessage out(MessageType::kError);
  out.SetText("message", text);
  return out;
}

PaillierPublicKey ReadPublicKey(const WireMessage& message) {
  const std::vector<mpz_class>& values = message.GetIntegerList(kPublicKeyField);
  if (values.size() != 2) {
    throw ProtocolViolation("public_key must be a [g, n] pair");
  }

  PaillierPublicKey out{values[0], values[1]};
  try {
    ValidatePaillierPublicKey(out);
  } catch (const std::invalid_argument& ex) {
    throw ProtocolViolation(std::string("invalid public key: ") + ex.what());
  }
  return out;
}

SigmaResponse ReadZkpResponse(const WireMessage& message, SigmaCommitment* commitment) {
  if (commitment == nullptr) {
    throw std::invalid_argument("commitment output must not be null");
  }
  commitment->a = message.GetInteger("u");
  return SigmaResponse{message.GetInteger("v"), message.GetInteger("w")};
}

void RequireMessageType(const WireMessage& message, MessageType expected) {
  if (message.type() != expected) {
    throw ProtocolViolation(std::string("expected ") + MessageTypeName(expected) + " but got " +
                            MessageTypeName(message.type()));
  }
}

}  // namespace zkvote
