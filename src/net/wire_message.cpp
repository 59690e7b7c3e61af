#include "zkvote/net/wire_message.hpp"

#include <array>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "zkvote/common/errors.hpp"
#include "zkvote/crypto/encoding.hpp"

namespace zkvote {
namespace {

constexpr char kTypeKey[] = "type";

struct MessageTypeEntry {
  MessageType type;
  const char* name;
};

constexpr std::array<MessageTypeEntry, 13> kMessageTypeNames = {{
    {MessageType::kPublicKey, "public_key"},
    {MessageType::kVote, "vote"},
    {MessageType::kGetResults, "get_results"},
    {MessageType::kDecryptedResult, "decrypted_result"},
    {MessageType::kZkpResponse, "zkp_response"},
    {MessageType::kClientId, "client_id"},
    {MessageType::kSharedPublicKey, "shared_public_key"},
    {MessageType::kFirstClientConfirmed, "first_client_confirmed"},
    {MessageType::kVoteReceived, "vote_received"},
    {MessageType::kEncryptedSum, "encrypted_sum"},
    {MessageType::kZkpChallenge, "zkp_challenge"},
    {MessageType::kZkpResult, "zkp_result"},
    {MessageType::kError, "error"},
}};

// nlohmann::json reports numbers beyond a double's range as parse errors, so wider integers are
// written as decimal strings.
constexpr size_t kMaxBareIntegerDigits = 300;

std::string DumpString(std::string_view text) {
  return nlohmann::json(std::string(text))
      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string EncodeIntegerToken(const mpz_class& value) {
  const std::string decimal = EncodeMpzDecimal(value);
  if (mpz_sizeinbase(value.get_mpz_t(), 10) <= kMaxBareIntegerDigits) {
    return decimal;
  }
  return DumpString(decimal);
}

mpz_class DecodeDecimalText(std::string_view text) {
  if (!IsCanonicalDecimal(text)) {
    throw ProtocolViolation("malformed record: \"" + std::string(text.substr(0, 32)) +
                            "\" is not a canonical integer");
  }
  return DecodeMpzDecimal(text, text.size());
}

// SAX consumer for one flat record. Field values are integers, integer arrays, strings and
// booleans; null fields are dropped; anything nested is rejected.
class RecordBuilder {
 public:
  using json = nlohmann::json;

  bool null() {
    RequireObjectValue();
    if (in_array_) {
      Unsupported();
    }
    RejectAtTypeKey();
    return true;
  }

  bool boolean(bool value) {
    RequireObjectValue();
    if (in_array_) {
      Unsupported();
    }
    RejectAtTypeKey();
    fields_.SetBool(pending_key_, value);
    return true;
  }

  bool number_integer(json::number_integer_t value) {
    AddInteger(mpz_class(static_cast<long>(value)));
    return true;
  }

  bool number_unsigned(json::number_unsigned_t value) {
    AddInteger(mpz_class(static_cast<unsigned long>(value)));
    return true;
  }

  bool number_float(json::number_float_t /*value*/, const json::string_t& raw) {
    // Integers wider than 64 bits arrive here; the raw token keeps every digit.
    AddInteger(DecodeDecimalText(raw));
    return true;
  }

  bool string(json::string_t& value) {
    RequireObjectValue();
    if (in_array_) {
      list_.push_back(DecodeDecimalText(value));
      return true;
    }
    if (pending_key_ == kTypeKey) {
      type_ = ParseMessageType(value);
      if (type_ == MessageType::kUnknown) {
        throw ProtocolViolation("unknown message type");
      }
      return true;
    }
    fields_.SetText(pending_key_, std::move(value));
    return true;
  }

  bool binary(json::binary_t& /*value*/) {
    Unsupported();
    return false;
  }

  bool start_object(std::size_t /*elements*/) {
    if (depth_ != 0) {
      Unsupported();
    }
    depth_ = 1;
    return true;
  }

  bool key(json::string_t& name) {
    if (!seen_keys_.insert(name).second) {
      throw ProtocolViolation(name == kTypeKey ? std::string("duplicate \"type\" field")
                                               : "duplicate field \"" + name + "\"");
    }
    pending_key_ = std::move(name);
    return true;
  }

  bool end_object() {
    depth_ = 0;
    return true;
  }

  bool start_array(std::size_t /*elements*/) {
    RequireObjectValue();
    if (in_array_) {
      Unsupported();
    }
    RejectAtTypeKey();
    in_array_ = true;
    list_.clear();
    return true;
  }

  bool end_array() {
    in_array_ = false;
    fields_.SetIntegerList(pending_key_, std::move(list_));
    list_.clear();
    return true;
  }

  bool parse_error(std::size_t /*position*/,
                   const std::string& /*last_token*/,
                   const nlohmann::detail::exception& ex) {
    throw ProtocolViolation(std::string("malformed record: ") + ex.what());
  }

  MessageType type() const {
    return type_;
  }

  WireMessage& fields() {
    return fields_;
  }

 private:
  void RequireObjectValue() const {
    if (depth_ == 0) {
      throw ProtocolViolation("record must be a JSON object");
    }
  }

  void RejectAtTypeKey() const {
    if (pending_key_ == kTypeKey) {
      throw ProtocolViolation("\"type\" must be a string");
    }
  }

  [[noreturn]] void Unsupported() const {
    throw ProtocolViolation("unsupported value for field \"" + pending_key_ + "\"");
  }

  void AddInteger(mpz_class value) {
    RequireObjectValue();
    if (in_array_) {
      list_.push_back(std::move(value));
      return;
    }
    RejectAtTypeKey();
    fields_.SetInteger(pending_key_, value);
  }

  int depth_ = 0;
  bool in_array_ = false;
  std::string pending_key_;
  std::set<std::string> seen_keys_;
  std::vector<mpz_class> list_;
  MessageType type_ = MessageType::kUnknown;
  WireMessage fields_;
};

}  // namespace

const char* MessageTypeName(MessageType type) {
  for (const MessageTypeEntry& entry : kMessageTypeNames) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

MessageType ParseMessageType(std::string_view name) {
  for (const MessageTypeEntry& entry : kMessageTypeNames) {
    if (name == entry.name) {
      return entry.type;
    }
  }
  return MessageType::kUnknown;
}

WireMessage::WireMessage(MessageType type) : type_(type) {}

MessageType WireMessage::type() const {
  return type_;
}

WireMessage& WireMessage::Set(std::string key, FieldValue value) {
  if (key == kTypeKey) {
    throw std::invalid_argument("\"type\" is reserved for the message tag");
  }
  for (auto& [existing_key, existing_value] : fields_) {
    if (existing_key == key) {
      existing_value = std::move(value);
      return *this;
    }
  }
  fields_.emplace_back(std::move(key), std::move(value));
  return *this;
}

WireMessage& WireMessage::SetInteger(std::string key, const mpz_class& value) {
  return Set(std::move(key), FieldValue(std::in_place_type<mpz_class>, value));
}

WireMessage& WireMessage::SetIntegerList(std::string key, std::vector<mpz_class> values) {
  return Set(std::move(key),
             FieldValue(std::in_place_type<std::vector<mpz_class>>, std::move(values)));
}

WireMessage& WireMessage::SetText(std::string key, std::string value) {
  return Set(std::move(key), FieldValue(std::in_place_type<std::string>, std::move(value)));
}

WireMessage& WireMessage::SetBool(std::string key, bool value) {
  return Set(std::move(key), FieldValue(std::in_place_type<bool>, value));
}

bool WireMessage::Has(std::string_view key) const {
  for (const auto& [existing_key, value] : fields_) {
    (void)value;
    if (existing_key == key) {
      return true;
    }
  }
  return false;
}

size_t WireMessage::field_count() const {
  return fields_.size();
}

const WireMessage::FieldValue& WireMessage::FindOrThrow(std::string_view key) const {
  for (const auto& [existing_key, value] : fields_) {
    if (existing_key == key) {
      return value;
    }
  }
  throw ProtocolViolation(std::string(MessageTypeName(type_)) + " message is missing field \"" +
                          std::string(key) + "\"");
}

mpz_class WireMessage::GetInteger(std::string_view key) const {
  const FieldValue& value = FindOrThrow(key);
  if (const auto* out = std::get_if<mpz_class>(&value)) {
    return *out;
  }
  const auto* text = std::get_if<std::string>(&value);
  if (text != nullptr && IsCanonicalDecimal(*text)) {
    return DecodeMpzDecimal(*text, text->size());
  }
  throw ProtocolViolation("field \"" + std::string(key) + "\" must be an integer");
}

const std::vector<mpz_class>& WireMessage::GetIntegerList(std::string_view key) const {
  const FieldValue& value = FindOrThrow(key);
  if (const auto* out = std::get_if<std::vector<mpz_class>>(&value)) {
    return *out;
  }
  throw ProtocolViolation("field \"" + std::string(key) + "\" must be an integer array");
}

const std::string& WireMessage::GetText(std::string_view key) const {
  const FieldValue& value = FindOrThrow(key);
  if (const auto* out = std::get_if<std::string>(&value)) {
    return *out;
  }
  throw ProtocolViolation("field \"" + std::string(key) + "\" must be a string");
}

bool WireMessage::GetBool(std::string_view key) const {
  const FieldValue& value = FindOrThrow(key);
  if (const auto* out = std::get_if<bool>(&value)) {
    return *out;
  }
  throw ProtocolViolation("field \"" + std::string(key) + "\" must be a boolean");
}

std::string EncodeWireMessage(const WireMessage& message) {
  if (message.type_ == MessageType::kUnknown) {
    throw std::invalid_argument("cannot encode a message without a type");
  }

  // Assembled field by field: nlohmann::json holds at most 64-bit integers, and the wire
  // carries big integers as bare numbers.
  std::string out = "{" + DumpString(kTypeKey) + ":" + DumpString(MessageTypeName(message.type_));
  for (const auto& [key, value] : message.fields_) {
    out += "," + DumpString(key) + ":";
    if (const auto* integer = std::get_if<mpz_class>(&value)) {
      out += EncodeIntegerToken(*integer);
    } else if (const auto* list = std::get_if<std::vector<mpz_class>>(&value)) {
      out.push_back('[');
      for (size_t i = 0; i < list->size(); ++i) {
        if (i != 0) {
          out.push_back(',');
        }
        out += EncodeIntegerToken((*list)[i]);
      }
      out.push_back(']');
    } else if (const auto* text = std::get_if<std::string>(&value)) {
      out += DumpString(*text);
    } else {
      out += std::get<bool>(value) ? "true" : "false";
    }
  }
  out.push_back('}');
  return out;
}

WireMessage DecodeWireMessage(std::string_view line, size_t max_len) {
  if (line.size() > max_len) {
    throw ProtocolViolation("record exceeds max message size");
  }

  RecordBuilder builder;
  if (!nlohmann::json::sax_parse(line.begin(), line.end(), &builder)) {
    throw ProtocolViolation("malformed record");
  }
  if (builder.type() == MessageType::kUnknown) {
    throw ProtocolViolation("record has no \"type\" field");
  }

  WireMessage out = std::move(builder.fields());
  out.type_ = builder.type();
  return out;
}

}  // namespace zkvote
