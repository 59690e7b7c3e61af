#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "zkvote/crypto/primes.hpp"
#include "zkvote/net/wire_message.hpp"
#include "zkvote/protocol/types.hpp"

namespace zkvote {

constexpr uint16_t kDefaultPort = 8888;

struct ServerConfig {
  std::string host = "127.0.0.1";
  uint16_t port = kDefaultPort;
  size_t max_voters = 10000;
  size_t max_message_size = kDefaultMaxMessageSize;

  // How long workers wait for the key holder's public key.
  std::chrono::milliseconds key_exchange_timeout = std::chrono::seconds(30);
  std::chrono::milliseconds challenge_response_timeout = std::chrono::seconds(30);
  // A connected client that sends nothing for this long is dropped.
  std::chrono::milliseconds idle_timeout = std::chrono::seconds(300);
  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100);

  bool shutdown_on_completion = true;
  // Time granted to workers to flush their last messages before channels are force-closed.
  std::chrono::milliseconds shutdown_grace_period = std::chrono::seconds(2);
};

struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t port = kDefaultPort;
  VoteChoice vote = VoteChoice::kYes;

  PrimeRange key_range;
  // When set, the key holder draws probable primes of this size instead of using key_range.
  std::optional<unsigned long> prime_bits;

  ProofMode proof_mode = ProofMode::kHonest;

  std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
  // Bound on every wait for a server reply outside the proof round.
  std::chrono::milliseconds response_timeout = std::chrono::seconds(30);
  // Bound on the wait for the challenge, which arrives only after the key holder tallies.
  std::chrono::milliseconds challenge_timeout = std::chrono::seconds(300);
  size_t max_message_size = kDefaultMaxMessageSize;

  // Key holder only: invoked before get_results is sent. Empty means tally right away.
  std::function<void()> tally_gate;
};

void ValidateServerConfig(const ServerConfig& config);
void ValidateClientConfig(const ClientConfig& config);

}  // namespace zkvote
