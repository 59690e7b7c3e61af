#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <gmpxx.h>

namespace zkvote {

// Server-assigned, "C1000".."C9999".
using ClientId = std::string;

enum class ClientRole : uint32_t {
  kVoter = 1,
  kKeyHolder = 2,
};

enum class VoteChoice : int32_t {
  kNo = -1,
  kYes = 1,
};

enum class TallyOutcome : uint32_t {
  kNo = 0,
  kTie = 1,
  kYes = 2,
};

// kFlipVote answers the challenge with the opposite vote, which an honest verifier rejects.
enum class ProofMode : uint32_t {
  kHonest = 0,
  kFlipVote = 1,
};

mpz_class VoteValue(VoteChoice vote);
VoteChoice OppositeVote(VoteChoice vote);
TallyOutcome ClassifyTally(const mpz_class& tally);

const char* ClientRoleName(ClientRole role);
ClientRole ParseClientRole(std::string_view name);
const char* VoteChoiceName(VoteChoice vote);
VoteChoice ParseVoteChoice(std::string_view name);
const char* TallyOutcomeName(TallyOutcome outcome);

}  // namespace zkvote
