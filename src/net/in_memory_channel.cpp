#include "zkvote/net/in_memory_channel.hpp"

#include "zkvote/common/errors.hpp"

namespace zkvote {

std::pair<std::shared_ptr<InMemoryChannel>, std::shared_ptr<InMemoryChannel>>
InMemoryChannel::CreatePair(const std::string& first_label, const std::string& second_label) {
  auto link = std::make_shared<Link>();
  // Each end is labelled by the peer it talks to.
  std::shared_ptr<InMemoryChannel> first(new InMemoryChannel(link, true, second_label));
  std::shared_ptr<InMemoryChannel> second(new InMemoryChannel(link, false, first_label));
  return {std::move(first), std::move(second)};
}

InMemoryChannel::InMemoryChannel(std::shared_ptr<Link> link,
                                 bool is_first,
                                 std::string peer_label)
    : link_(std::move(link)), is_first_(is_first), peer_label_(std::move(peer_label)) {}

InMemoryChannel::~InMemoryChannel() {
  Close();
}

std::deque<std::string>& InMemoryChannel::inbox() {
  return is_first_ ? link_->to_first : link_->to_second;
}

std::deque<std::string>& InMemoryChannel::outbox() {
  return is_first_ ? link_->to_second : link_->to_first;
}

void InMemoryChannel::SendLine(const std::string& line) {
  {
    std::lock_guard<std::mutex> lock(link_->mu);
    if (link_->closed) {
      throw ChannelClosed("in-memory channel to " + peer_label_ + " is closed");
    }
    outbox().push_back(line);
  }
  link_->cv.notify_all();
}

std::optional<std::string> InMemoryChannel::ReadLine(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(link_->mu);
  link_->cv.wait_for(lock, timeout, [this]() { return link_->closed || !inbox().empty(); });
  // Lines already delivered stay readable after the peer hangs up.
  if (!inbox().empty()) {
    std::string line = std::move(inbox().front());
    inbox().pop_front();
    return line;
  }
  if (link_->closed) {
    throw ChannelClosed("in-memory channel to " + peer_label_ + " is closed");
  }
  return std::nullopt;
}

void InMemoryChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(link_->mu);
    if (link_->closed) {
      return;
    }
    link_->closed = true;
  }
  link_->cv.notify_all();
}

bool InMemoryChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(link_->mu);
  return link_->closed;
}

std::string InMemoryChannel::peer_label() const {
  return peer_label_;
}

}  // namespace zkvote
