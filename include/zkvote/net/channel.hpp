#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "zkvote/net/wire_message.hpp"

namespace zkvote {

// A bidirectional, line-oriented connection between one client and the server.
// SendLine may be called from several threads; ReadLine is single-reader.
class MessageChannel {
 public:
  virtual ~MessageChannel() = default;

  // Appends the record terminator. Throws ChannelClosed if the peer is gone.
  virtual void SendLine(const std::string& line) = 0;

  // Returns std::nullopt when no complete line arrives within `timeout`.
  // Throws ChannelClosed on end of stream and ProtocolViolation on an oversized line.
  virtual std::optional<std::string> ReadLine(std::chrono::milliseconds timeout) = 0;

  // Idempotent. Unblocks a concurrent ReadLine.
  virtual void Close() = 0;
  virtual bool IsClosed() const = 0;

  virtual std::string peer_label() const = 0;
};

void SendWireMessage(MessageChannel& channel, const WireMessage& message);

std::optional<WireMessage> ReadWireMessage(MessageChannel& channel,
                                           std::chrono::milliseconds timeout,
                                           size_t max_len = kDefaultMaxMessageSize);

}  // namespace zkvote
