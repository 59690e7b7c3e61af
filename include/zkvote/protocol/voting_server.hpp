#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "zkvote/common/worker_group.hpp"
#include "zkvote/net/channel.hpp"
#include "zkvote/net/tcp_channel.hpp"
#include "zkvote/protocol/config.hpp"
#include "zkvote/protocol/session_state.hpp"

namespace zkvote {

// Accepts voters over TCP and drives one election through SessionState, one worker thread per
// connection.
class VotingServer {
 public:
  explicit VotingServer(ServerConfig config);
  ~VotingServer();

  VotingServer(const VotingServer&) = delete;
  VotingServer& operator=(const VotingServer&) = delete;

  // Binds the listener. Throws std::runtime_error if the address is unavailable.
  void Start();
  // Serves until shutdown is requested or, with shutdown_on_completion, the election closes.
  // Calls Start() first if needed.
  void Run();

  // Only flips an atomic flag, so it may be called from a signal handler.
  void RequestShutdown();
  bool shutdown_requested() const;

  // The bound port; meaningful after Start().
  uint16_t port() const;

  SessionState& state();
  const SessionState& state() const;
  VerificationReport report() const;

  // Serves one already-accepted connection on the calling thread.
  void ServeConnection(std::shared_ptr<MessageChannel> channel);

 private:
  std::optional<WireMessage> ReadFromClient(MessageChannel& channel,
                                            std::chrono::milliseconds timeout);
  void ExchangeKey(MessageChannel& channel, const Registration& registration);
  void HandleGetResults(MessageChannel& channel, const ClientId& client_id);
  void DrainWorkers();

  ServerConfig config_;
  SessionState state_;
  std::unique_ptr<TcpListener> listener_;
  WorkerGroup workers_;
  std::atomic<bool> shutdown_requested_{false};
};

}  // namespace zkvote
