#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "zkvote/net/channel.hpp"

namespace zkvote {

// A connected pair of in-process channels. Closing either end closes both directions, like a
// TCP connection torn down by one side.
class InMemoryChannel : public MessageChannel {
 public:
  static std::pair<std::shared_ptr<InMemoryChannel>, std::shared_ptr<InMemoryChannel>> CreatePair(
      const std::string& first_label = "client",
      const std::string& second_label = "server");

  ~InMemoryChannel() override;

  InMemoryChannel(const InMemoryChannel&) = delete;
  InMemoryChannel& operator=(const InMemoryChannel&) = delete;

  void SendLine(const std::string& line) override;
  std::optional<std::string> ReadLine(std::chrono::milliseconds timeout) override;
  void Close() override;
  bool IsClosed() const override;
  std::string peer_label() const override;

 private:
  struct Link {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<std::string> to_first;
    std::deque<std::string> to_second;
    bool closed = false;
  };

  InMemoryChannel(std::shared_ptr<Link> link, bool is_first, std::string peer_label);

  std::deque<std::string>& inbox();
  std::deque<std::string>& outbox();

  std::shared_ptr<Link> link_;
  bool is_first_;
  std::string peer_label_;
};

}  // namespace zkvote
