#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <gmpxx.h>

namespace zkvote {

// Canonical base-10 text: optional '-', no leading zeros, no "-0".
std::string EncodeMpzDecimal(const mpz_class& value);
mpz_class DecodeMpzDecimal(std::string_view text, size_t max_digits = 8192);

bool IsCanonicalDecimal(std::string_view text);

}  // namespace zkvote
