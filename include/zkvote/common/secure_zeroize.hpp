#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <gmpxx.h>

#include "zkvote/common/bytes.hpp"
#include "zkvote/crypto/sigma_proof.hpp"

namespace zkvote {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

// Overwrites the limbs in place before resetting, so the old magnitude does not linger in the
// GMP allocation.
inline void SecureZeroize(mpz_class* value) noexcept {
  if (value == nullptr) {
    return;
  }
  mpz_ptr raw = value->get_mpz_t();
  const size_t limbs = mpz_size(raw);
  if (limbs > 0) {
    SecureZeroizeMemory(mpz_limbs_modify(raw, static_cast<mp_size_t>(limbs)),
                        limbs * sizeof(mp_limb_t));
  }
  mpz_set_ui(raw, 0);
}

inline void SecureZeroize(SigmaNonce* nonce) noexcept {
  if (nonce == nullptr) {
    return;
  }
  SecureZeroize(&nonce->x);
  SecureZeroize(&nonce->s);
}

inline void SecureZeroize(ProverWitness* witness) noexcept {
  if (witness == nullptr) {
    return;
  }
  SecureZeroize(&witness->plaintext);
  SecureZeroize(&witness->randomness);
  SecureZeroize(&witness->nonce);
}

inline void SecureZeroize(std::optional<ProverWitness>* witness) noexcept {
  if (witness == nullptr) {
    return;
  }
  if (witness->has_value()) {
    SecureZeroize(&witness->value());
  }
  witness->reset();
}

}  // namespace zkvote
