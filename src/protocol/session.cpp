#include "zkvote/protocol/session.hpp"

#include "zkvote/common/errors.hpp"

namespace zkvote {

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kRunning:
      return "running";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kAborted:
      return "aborted";
    case SessionStatus::kTimedOut:
      return "timed_out";
  }
  return "unknown";
}

const ClientId& Session::self_id() const {
  return self_id_;
}

SessionStatus Session::status() const {
  return status_;
}

bool Session::IsTerminal() const {
  return status_ == SessionStatus::kCompleted ||
         status_ == SessionStatus::kAborted ||
         status_ == SessionStatus::kTimedOut;
}

const std::string& Session::abort_reason() const {
  return abort_reason_;
}

std::chrono::steady_clock::time_point Session::last_activity() const {
  return last_activity_;
}

void Session::AssignIdentity(const ClientId& id) {
  if (id.empty()) {
    throw ProtocolViolation("server assigned an empty client id");
  }
  if (!self_id_.empty()) {
    throw ProtocolViolation("client id already assigned");
  }
  self_id_ = id;
}

void Session::Touch(std::chrono::steady_clock::time_point now) {
  last_activity_ = now;
}

void Session::Abort(const std::string& reason) {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kAborted;
  abort_reason_ = reason;
}

void Session::TimeOut(const std::string& reason) {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kTimedOut;
  abort_reason_ = reason;
}

void Session::Complete() {
  if (IsTerminal()) {
    return;
  }
  status_ = SessionStatus::kCompleted;
  abort_reason_.clear();
}

}  // namespace zkvote
