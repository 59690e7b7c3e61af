#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "zkvote/net/channel.hpp"

namespace zkvote {

// Owns a connected stream socket. Reads poll in short slices so Close() from another thread
// unblocks a pending ReadLine promptly.
class TcpChannel : public MessageChannel {
 public:
  TcpChannel(int fd, std::string peer_label, size_t max_line_len = kDefaultMaxMessageSize);
  ~TcpChannel() override;

  TcpChannel(const TcpChannel&) = delete;
  TcpChannel& operator=(const TcpChannel&) = delete;

  void SendLine(const std::string& line) override;
  std::optional<std::string> ReadLine(std::chrono::milliseconds timeout) override;
  void Close() override;
  bool IsClosed() const override;
  std::string peer_label() const override;

 private:
  std::optional<std::string> TakeBufferedLine();

  int fd_;
  std::string peer_label_;
  size_t max_line_len_;

  std::mutex write_mu_;
  std::string read_buffer_;
  std::atomic<bool> closed_{false};
};

class TcpListener {
 public:
  // Port 0 binds an ephemeral port; port() reports the bound one.
  TcpListener(const std::string& host, uint16_t port, int backlog = 64);
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  uint16_t port() const;

  // Returns nullptr when nothing connects within `timeout`.
  std::unique_ptr<TcpChannel> Accept(std::chrono::milliseconds timeout,
                                     size_t max_line_len = kDefaultMaxMessageSize);

  void Close();
  bool IsClosed() const;

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
};

// Throws std::runtime_error if no address accepts the connection within `timeout`.
std::unique_ptr<TcpChannel> ConnectTcp(const std::string& host,
                                       uint16_t port,
                                       std::chrono::milliseconds timeout,
                                       size_t max_line_len = kDefaultMaxMessageSize);

}  // namespace zkvote
