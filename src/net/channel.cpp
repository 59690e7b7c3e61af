#include "zkvote/net/channel.hpp"

namespace zkvote {

void SendWireMessage(MessageChannel& channel, const WireMessage& message) {
  channel.SendLine(EncodeWireMessage(message));
}

std::optional<WireMessage> ReadWireMessage(MessageChannel& channel,
                                           std::chrono::milliseconds timeout,
                                           size_t max_len) {
  std::optional<std::string> line = channel.ReadLine(timeout);
  if (!line.has_value()) {
    return std::nullopt;
  }
  return DecodeWireMessage(*line, max_len);
}

}  // namespace zkvote
