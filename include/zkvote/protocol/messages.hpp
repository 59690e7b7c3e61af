#pragma once

#include <string>

#include <gmpxx.h>

#include "zkvote/crypto/paillier.hpp"
#include "zkvote/crypto/sigma_proof.hpp"
#include "zkvote/net/wire_message.hpp"
#include "zkvote/protocol/types.hpp"

namespace zkvote {

// Client -> server.
WireMessage MakePublicKeyMessage(const PaillierPublicKey& public_key);
WireMessage MakeVoteMessage(const mpz_class& encrypted_vote, const SigmaCommitment& commitment);
WireMessage MakeGetResultsMessage();
WireMessage MakeDecryptedResultMessage(const mpz_class& result);
WireMessage MakeZkpResponseMessage(const SigmaCommitment& commitment,
                                   const SigmaResponse& response);

// Server -> client.
WireMessage MakeClientIdMessage(const ClientId& client_id, ClientRole role);
WireMessage MakeSharedPublicKeyMessage(const PaillierPublicKey& public_key);
WireMessage MakeFirstClientConfirmedMessage();
WireMessage MakeVoteReceivedMessage();
WireMessage MakeEncryptedSumMessage(const mpz_class& encrypted_sum);
WireMessage MakeZkpChallengeMessage(const mpz_class& challenge);
WireMessage MakeZkpResultMessage(bool valid);
WireMessage MakeErrorMessage(const std::string& text);

// Reads the [g, n] pair under "public_key" and checks it is a well-formed Paillier key.
PaillierPublicKey ReadPublicKey(const WireMessage& message);
SigmaResponse ReadZkpResponse(const WireMessage& message, SigmaCommitment* commitment);

// Throws ProtocolViolation naming both types on a mismatch.
void RequireMessageType(const WireMessage& message, MessageType expected);

}  // namespace zkvote
