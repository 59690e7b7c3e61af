#pragma once

#include <stdexcept>
#include <string>

namespace zkvote {

// Unable to produce a valid Paillier key pair. Fatal to the generating session.
class KeyGenerationError : public std::runtime_error {
 public:
  explicit KeyGenerationError(const std::string& what) : std::runtime_error(what) {}
};

// Plaintext outside (-n/2, n/2).
class EncryptionError : public std::invalid_argument {
 public:
  explicit EncryptionError(const std::string& what) : std::invalid_argument(what) {}
};

// Ciphertext cannot be decoded under the given key.
class DecryptionError : public std::runtime_error {
 public:
  explicit DecryptionError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed or out-of-phase message. The offending connection is dropped.
class ProtocolViolation : public std::runtime_error {
 public:
  explicit ProtocolViolation(const std::string& what) : std::runtime_error(what) {}
};

class SessionClosedError : public ProtocolViolation {
 public:
  explicit SessionClosedError(const std::string& what) : ProtocolViolation(what) {}
};

// The tally step cannot run yet. Reported to the requester; the session continues.
class TallyError : public std::runtime_error {
 public:
  explicit TallyError(const std::string& what) : std::runtime_error(what) {}
};

class ChannelClosed : public std::runtime_error {
 public:
  explicit ChannelClosed(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace zkvote
