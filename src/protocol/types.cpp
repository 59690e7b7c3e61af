#include "zkvote/protocol/types.hpp"

#include <stdexcept>

#include "zkvote/common/errors.hpp"

namespace zkvote {

mpz_class VoteValue(VoteChoice vote) {
  return vote == VoteChoice::kYes ? mpz_class(1) : mpz_class(-1);
}

VoteChoice OppositeVote(VoteChoice vote) {
  return vote == VoteChoice::kYes ? VoteChoice::kNo : VoteChoice::kYes;
}

TallyOutcome ClassifyTally(const mpz_class& tally) {
  const int sign = sgn(tally);
  if (sign > 0) {
    return TallyOutcome::kYes;
  }
  if (sign < 0) {
    return TallyOutcome::kNo;
  }
  return TallyOutcome::kTie;
}

const char* ClientRoleName(ClientRole role) {
  switch (role) {
    case ClientRole::kVoter:
      return "voter";
    case ClientRole::kKeyHolder:
      return "key_holder";
  }
  return "unknown";
}

// Arrives off the wire, so a bad name is the peer's fault.
ClientRole ParseClientRole(std::string_view name) {
  if (name == "voter") {
    return ClientRole::kVoter;
  }
  if (name == "key_holder") {
    return ClientRole::kKeyHolder;
  }
  throw ProtocolViolation("unknown client role: " + std::string(name));
}

const char* VoteChoiceName(VoteChoice vote) {
  return vote == VoteChoice::kYes ? "yes" : "no";
}

VoteChoice ParseVoteChoice(std::string_view name) {
  if (name == "yes" || name == "YES") {
    return VoteChoice::kYes;
  }
  if (name == "no" || name == "NO") {
    return VoteChoice::kNo;
  }
  throw std::invalid_argument("vote must be yes or no, got: " + std::string(name));
}

const char* TallyOutcomeName(TallyOutcome outcome) {
  switch (outcome) {
    case TallyOutcome::kNo:
      return "NO";
    case TallyOutcome::kTie:
      return "TIE";
    case TallyOutcome::kYes:
      return "YES";
  }
  return "UNKNOWN";
}

}  // namespace zkvote
