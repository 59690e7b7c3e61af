#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <gmpxx.h>

namespace zkvote {

constexpr size_t kDefaultMaxMessageSize = 1 << 20;

enum class MessageType : uint32_t {
  kUnknown = 0,
  // client -> server
  kPublicKey = 1,
  kVote = 2,
  kGetResults = 3,
  kDecryptedResult = 4,
  kZkpResponse = 5,
  // server -> client
  kClientId = 101,
  kSharedPublicKey = 102,
  kFirstClientConfirmed = 103,
  kVoteReceived = 104,
  kEncryptedSum = 105,
  kZkpChallenge = 106,
  kZkpResult = 107,
  kError = 199,
};

const char* MessageTypeName(MessageType type);
MessageType ParseMessageType(std::string_view name);

class WireMessage;

// Encoded without the trailing newline. Integers up to 300 digits are bare JSON numbers, wider
// ones decimal strings. Decoding goes through nlohmann::json; malformed JSON, duplicate keys,
// non-integer numbers and nested values throw ProtocolViolation. Null fields are ignored.
std::string EncodeWireMessage(const WireMessage& message);
WireMessage DecodeWireMessage(std::string_view line, size_t max_len = kDefaultMaxMessageSize);

// One newline-delimited record: a flat JSON object tagged by "type". Field values are big
// integers (bare JSON numbers), integer arrays, strings or booleans.
class WireMessage {
 public:
  WireMessage() = default;
  explicit WireMessage(MessageType type);

  MessageType type() const;

  WireMessage& SetInteger(std::string key, const mpz_class& value);
  WireMessage& SetIntegerList(std::string key, std::vector<mpz_class> values);
  WireMessage& SetText(std::string key, std::string value);
  WireMessage& SetBool(std::string key, bool value);

  bool Has(std::string_view key) const;
  size_t field_count() const;

  // Missing keys and wrong value kinds throw ProtocolViolation.
  // Also accepts a canonical decimal string.
  mpz_class GetInteger(std::string_view key) const;
  const std::vector<mpz_class>& GetIntegerList(std::string_view key) const;
  const std::string& GetText(std::string_view key) const;
  bool GetBool(std::string_view key) const;

 private:
  friend std::string EncodeWireMessage(const WireMessage& message);
  friend WireMessage DecodeWireMessage(std::string_view line, size_t max_len);

  using FieldValue = std::variant<mpz_class, std::vector<mpz_class>, std::string, bool>;

  const FieldValue& FindOrThrow(std::string_view key) const;
  WireMessage& Set(std::string key, FieldValue value);

  MessageType type_ = MessageType::kUnknown;
  std::vector<std::pair<std::string, FieldValue>> fields_;
};

}  // namespace zkvote
