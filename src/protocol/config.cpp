#include "zkvote/protocol/config.hpp"

#include <stdexcept>

namespace zkvote {
namespace {

void RequirePositive(std::chrono::milliseconds value, const char* name) {
  if (value.count() <= 0) {
    throw std::invalid_argument(std::string(name) + " must be positive");
  }
}

}  // namespace

void ValidateServerConfig(const ServerConfig& config) {
  if (config.host.empty()) {
    throw std::invalid_argument("server host must not be empty");
  }
  if (config.max_voters == 0) {
    throw std::invalid_argument("max_voters must be positive");
  }
  if (config.max_message_size < 64) {
    throw std::invalid_argument("max_message_size must be at least 64 bytes");
  }
  RequirePositive(config.key_exchange_timeout, "key_exchange_timeout");
  RequirePositive(config.challenge_response_timeout, "challenge_response_timeout");
  RequirePositive(config.idle_timeout, "idle_timeout");
  RequirePositive(config.poll_interval, "poll_interval");
  if (config.shutdown_grace_period.count() < 0) {
    throw std::invalid_argument("shutdown_grace_period must not be negative");
  }
}

void ValidateClientConfig(const ClientConfig& config) {
  if (config.host.empty()) {
    throw std::invalid_argument("client host must not be empty");
  }
  if (config.port == 0) {
    throw std::invalid_argument("client port must be non-zero");
  }
  if (config.prime_bits.has_value()) {
    if (*config.prime_bits < 3) {
      throw std::invalid_argument("prime_bits must be at least 3");
    }
  } else {
    ValidatePrimeRange(config.key_range);
  }
  if (config.max_message_size < 64) {
    throw std::invalid_argument("max_message_size must be at least 64 bytes");
  }
  RequirePositive(config.connect_timeout, "connect_timeout");
  RequirePositive(config.response_timeout, "response_timeout");
  RequirePositive(config.challenge_timeout, "challenge_timeout");
}

}  // namespace zkvote
