#include "zkvote/net/tcp_channel.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "zkvote/common/errors.hpp"

namespace zkvote {
namespace {

constexpr std::chrono::milliseconds kPollSlice(100);
constexpr size_t kReadChunk = 4096;

std::string ErrnoText(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

std::string DescribePeer(const sockaddr* address, socklen_t length) {
  char host[NI_MAXHOST];
  char service[NI_MAXSERV];
  if (getnameinfo(address, length, host, sizeof(host), service, sizeof(service),
                  NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "unknown";
  }
  return std::string(host) + ":" + service;
}

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      freeaddrinfo(info);
    }
  }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr Resolve(const std::string& host, uint16_t port, bool passive) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = passive ? AI_PASSIVE : 0;

  addrinfo* raw = nullptr;
  const std::string service = std::to_string(port);
  const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &raw);
  if (rc != 0) {
    throw std::runtime_error("cannot resolve " + host + ":" + service + ": " + gai_strerror(rc));
  }
  return AddrInfoPtr(raw);
}

void SetNoDelay(int fd) {
  int one = 1;
  (void)setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

}  // namespace

TcpChannel::TcpChannel(int fd, std::string peer_label, size_t max_line_len)
    : fd_(fd), peer_label_(std::move(peer_label)), max_line_len_(max_line_len) {
  if (fd_ < 0) {
    throw std::invalid_argument("TcpChannel requires a connected socket");
  }
  if (max_line_len_ == 0) {
    throw std::invalid_argument("max_line_len must be positive");
  }
}

TcpChannel::~TcpChannel() {
  Close();
  ::close(fd_);
}

void TcpChannel::SendLine(const std::string& line) {
  std::string framed = line;
  framed.push_back('\n');

  std::lock_guard<std::mutex> lock(write_mu_);
  if (closed_.load()) {
    throw ChannelClosed("channel to " + peer_label_ + " is closed");
  }

  size_t sent = 0;
  while (sent < framed.size()) {
    const ssize_t rc = ::send(fd_, framed.data() + sent, framed.size() - sent, MSG_NOSIGNAL);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ChannelClosed(ErrnoText("send to " + peer_label_ + " failed"));
    }
    sent += static_cast<size_t>(rc);
  }
}

std::optional<std::string> TcpChannel::TakeBufferedLine() {
  const size_t newline = read_buffer_.find('\n');
  if (newline == std::string::npos) {
    if (read_buffer_.size() > max_line_len_) {
      throw ProtocolViolation("record from " + peer_label_ + " exceeds max message size");
    }
    return std::nullopt;
  }

  std::string line = read_buffer_.substr(0, newline);
  read_buffer_.erase(0, newline + 1);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line.size() > max_line_len_) {
    throw ProtocolViolation("record from " + peer_label_ + " exceeds max message size");
  }
  return line;
}

std::optional<std::string> TcpChannel::ReadLine(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (std::optional<std::string> line = TakeBufferedLine(); line.has_value()) {
      return line;
    }
    if (closed_.load()) {
      throw ChannelClosed("channel to " + peer_label_ + " is closed");
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline && timeout.count() > 0) {
      return std::nullopt;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto slice = std::clamp(remaining, std::chrono::milliseconds(0), kPollSlice);

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ChannelClosed(ErrnoText("poll on " + peer_label_ + " failed"));
    }
    if (ready == 0) {
      if (timeout.count() <= 0) {
        return std::nullopt;
      }
      continue;
    }

    char chunk[kReadChunk];
    const ssize_t received = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (received == 0) {
      throw ChannelClosed("peer " + peer_label_ + " closed the connection");
    }
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      throw ChannelClosed(ErrnoText("recv from " + peer_label_ + " failed"));
    }
    read_buffer_.append(chunk, static_cast<size_t>(received));
  }
}

void TcpChannel::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  ::shutdown(fd_, SHUT_RDWR);
}

bool TcpChannel::IsClosed() const {
  return closed_.load();
}

std::string TcpChannel::peer_label() const {
  return peer_label_;
}

TcpListener::TcpListener(const std::string& host, uint16_t port, int backlog) {
  AddrInfoPtr addresses = Resolve(host, port, /*passive=*/true);

  std::string last_error = "no usable address";
  for (addrinfo* it = addresses.get(); it != nullptr; it = it->ai_next) {
    const int fd = ::socket(it->ai_family, it->ai_socktype, it->ai_protocol);
    if (fd < 0) {
      last_error = ErrnoText("socket");
      continue;
    }
    int one = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, it->ai_addr, it->ai_addrlen) != 0) {
      last_error = ErrnoText("bind");
      ::close(fd);
      continue;
    }
    if (::listen(fd, backlog) != 0) {
      last_error = ErrnoText("listen");
      ::close(fd);
      continue;
    }
    fd_ = fd;
    break;
  }
  if (fd_ < 0) {
    throw std::runtime_error("cannot listen on " + host + ":" + std::to_string(port) + ": " +
                             last_error);
  }

  sockaddr_storage bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) != 0) {
    const std::string error = ErrnoText("getsockname");
    ::close(fd_);
    throw std::runtime_error(error);
  }
  if (bound.ss_family == AF_INET6) {
    port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
  } else {
    port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
  }
}

TcpListener::~TcpListener() {
  Close();
}

uint16_t TcpListener::port() const {
  return port_;
}

std::unique_ptr<TcpChannel> TcpListener::Accept(std::chrono::milliseconds timeout,
                                                size_t max_line_len) {
  if (fd_ < 0) {
    throw std::logic_error("Accept on a closed listener");
  }

  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready < 0) {
    if (errno == EINTR) {
      return nullptr;
    }
    throw std::runtime_error(ErrnoText("poll on listener failed"));
  }
  if (ready == 0) {
    return nullptr;
  }

  sockaddr_storage peer{};
  socklen_t peer_len = sizeof(peer);
  const int fd = ::accept(fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
  if (fd < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED) {
      return nullptr;
    }
    throw std::runtime_error(ErrnoText("accept failed"));
  }
  SetNoDelay(fd);
  return std::make_unique<TcpChannel>(
      fd, DescribePeer(reinterpret_cast<sockaddr*>(&peer), peer_len), max_line_len);
}

void TcpListener::Close() {
  if (fd_ < 0) {
    return;
  }
  ::close(fd_);
  fd_ = -1;
}

bool TcpListener::IsClosed() const {
  return fd_ < 0;
}

std::unique_ptr<TcpChannel> ConnectTcp(const std::string& host,
                                       uint16_t port,
                                       std::chrono::milliseconds timeout,
                                       size_t max_line_len) {
  AddrInfoPtr addresses = Resolve(host, port, /*passive=*/false);

  std::string last_error = "no usable address";
  for (addrinfo* it = addresses.get(); it != nullptr; it = it->ai_next) {
    const int fd = ::socket(it->ai_family, it->ai_socktype, it->ai_protocol);
    if (fd < 0) {
      last_error = ErrnoText("socket");
      continue;
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
      last_error = ErrnoText("fcntl");
      ::close(fd);
      continue;
    }

    int rc = ::connect(fd, it->ai_addr, it->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      if (rc == 0) {
        last_error = "connect timed out";
        ::close(fd);
        continue;
      }
      if (rc < 0) {
        last_error = ErrnoText("poll");
        ::close(fd);
        continue;
      }
      int so_error = 0;
      socklen_t so_len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0) {
        last_error = std::string("connect: ") + std::strerror(so_error);
        ::close(fd);
        continue;
      }
      rc = 0;
    }
    if (rc != 0) {
      last_error = ErrnoText("connect");
      ::close(fd);
      continue;
    }

    if (::fcntl(fd, F_SETFL, flags) != 0) {
      last_error = ErrnoText("fcntl");
      ::close(fd);
      continue;
    }
    SetNoDelay(fd);
    return std::make_unique<TcpChannel>(fd, DescribePeer(it->ai_addr, it->ai_addrlen),
                                        max_line_len);
  }
  throw std::runtime_error("cannot connect to " + host + ":" + std::to_string(port) + ": " +
                           last_error);
}

}  // namespace zkvote
