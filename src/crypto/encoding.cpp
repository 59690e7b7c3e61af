#include "zkvote/crypto/encoding.hpp"

#include <stdexcept>

namespace zkvote {

std::string EncodeMpzDecimal(const mpz_class& value) {
  return value.get_str(10);
}

bool IsCanonicalDecimal(std::string_view text) {
  if (text.empty()) {
    return false;
  }

  size_t offset = 0;
  if (text[0] == '-') {
    offset = 1;
  }
  if (offset == text.size()) {
    return false;
  }

  const std::string_view digits = text.substr(offset);
  for (char ch : digits) {
    if (ch < '0' || ch > '9') {
      return false;
    }
  }

  if (digits.size() > 1 && digits[0] == '0') {
    return false;
  }
  if (offset == 1 && digits == "0") {
    return false;
  }
  return true;
}

mpz_class DecodeMpzDecimal(std::string_view text, size_t max_digits) {
  if (text.size() > max_digits + 1) {
    throw std::invalid_argument("decimal integer exceeds max_digits");
  }
  if (!IsCanonicalDecimal(text)) {
    throw std::invalid_argument("malformed decimal integer");
  }

  mpz_class out;
  if (out.set_str(std::string(text), 10) != 0) {
    throw std::invalid_argument("malformed decimal integer");
  }
  return out;
}

}  // namespace zkvote
