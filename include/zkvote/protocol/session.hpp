#pragma once

#include <chrono>
#include <string>

#include "zkvote/protocol/types.hpp"

namespace zkvote {

enum class SessionStatus {
  kRunning = 0,
  kCompleted = 1,
  kAborted = 2,
  kTimedOut = 3,
};

const char* SessionStatusName(SessionStatus status);

// Terminal-state bookkeeping shared by protocol participants. The first terminal transition
// wins; later Abort/Complete calls are ignored.
class Session {
 public:
  Session() = default;
  virtual ~Session() = default;

  // Empty until the server assigns one.
  const ClientId& self_id() const;

  SessionStatus status() const;
  bool IsTerminal() const;
  const std::string& abort_reason() const;

  std::chrono::steady_clock::time_point last_activity() const;

 protected:
  void AssignIdentity(const ClientId& id);

  void Touch(std::chrono::steady_clock::time_point now =
                 std::chrono::steady_clock::now());
  void Abort(const std::string& reason);
  void TimeOut(const std::string& reason);
  void Complete();

 private:
  ClientId self_id_;
  std::chrono::steady_clock::time_point last_activity_ = std::chrono::steady_clock::now();

  SessionStatus status_ = SessionStatus::kRunning;
  std::string abort_reason_;
};

}  // namespace zkvote
