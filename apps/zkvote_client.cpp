#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "zkvote/common/logging.hpp"
#include "zkvote/protocol/config.hpp"
#include "zkvote/protocol/voter_client.hpp"

namespace {

using zkvote::ClientConfig;
using zkvote::ClientOutcome;

struct ClientArgs {
  ClientConfig config;
  // Unset: the key holder waits for Enter on stdin before tallying.
  std::optional<std::chrono::milliseconds> tally_delay;
  zkvote::LogLevel log_level = boost::log::trivial::info;
};

uint64_t ParseU64(const char* value, const char* flag, uint64_t min, uint64_t max) {
  try {
    const unsigned long long parsed = std::stoull(value);
    if (parsed < min || parsed > max) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint64_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

void PrintUsage() {
  std::cout << "Usage: zkvote_client yes|no [--host H] [--port P]\n"
               "                      [--prime-min A --prime-max B | --prime-bits BITS]\n"
               "                      [--fraud] [--tally-delay-ms MS] [--log-level LEVEL]\n";
}

ClientArgs ParseArgs(int argc, char** argv) {
  ClientArgs args;
  bool vote_given = false;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--host" && i + 1 < argc) {
      args.config.host = argv[++i];
    } else if (flag == "--port" && i + 1 < argc) {
      args.config.port = static_cast<uint16_t>(ParseU64(argv[++i], "--port", 1, UINT16_MAX));
    } else if (flag == "--prime-min" && i + 1 < argc) {
      args.config.key_range.min = argv[++i];
    } else if (flag == "--prime-max" && i + 1 < argc) {
      args.config.key_range.max = argv[++i];
    } else if (flag == "--prime-bits" && i + 1 < argc) {
      args.config.prime_bits = ParseU64(argv[++i], "--prime-bits", 3, 8192);
    } else if (flag == "--fraud") {
      args.config.proof_mode = zkvote::ProofMode::kFlipVote;
    } else if (flag == "--tally-delay-ms" && i + 1 < argc) {
      args.tally_delay =
          std::chrono::milliseconds(ParseU64(argv[++i], "--tally-delay-ms", 0, INT32_MAX));
    } else if (flag == "--log-level" && i + 1 < argc) {
      args.log_level = zkvote::ParseLogLevel(argv[++i]);
    } else if (flag == "--help") {
      PrintUsage();
      std::exit(0);
    } else if (!vote_given && !flag.empty() && flag[0] != '-') {
      args.config.vote = zkvote::ParseVoteChoice(flag);
      vote_given = true;
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }
  if (!vote_given) {
    throw std::invalid_argument("a vote (yes or no) is required");
  }
  return args;
}

void PrintOutcome(const ClientOutcome& outcome) {
  std::cout << "client " << (outcome.client_id.empty() ? "-" : outcome.client_id);
  if (outcome.role.has_value()) {
    std::cout << " (" << zkvote::ClientRoleName(*outcome.role) << ")";
  }
  std::cout << ": " << zkvote::SessionStatusName(outcome.status) << '\n';
  if (!outcome.abort_reason.empty()) {
    std::cout << "reason: " << outcome.abort_reason << '\n';
  }
  if (outcome.tally.has_value()) {
    std::cout << "tally: " << outcome.tally->get_str() << " => "
              << zkvote::TallyOutcomeName(*outcome.tally_outcome) << '\n';
  }
  if (!outcome.decryption_error.empty()) {
    std::cout << "decryption failed: " << outcome.decryption_error << '\n';
  }
  if (outcome.proof_accepted.has_value()) {
    std::cout << "proof " << (*outcome.proof_accepted ? "accepted" : "rejected") << '\n';
  }
}

}  // namespace

int main(int argc, char** argv) {
  try {
    ClientArgs args = ParseArgs(argc, argv);
    zkvote::InitLogging(args.log_level);

    if (args.tally_delay.has_value()) {
      const std::chrono::milliseconds delay = *args.tally_delay;
      args.config.tally_gate = [delay]() { std::this_thread::sleep_for(delay); };
    } else {
      args.config.tally_gate = []() {
        std::cout << "You hold the key. Press Enter once everyone has voted..." << std::flush;
        std::string ignored;
        std::getline(std::cin, ignored);
      };
    }

    const ClientOutcome outcome = zkvote::RunVoterClient(args.config);
    PrintOutcome(outcome);
    return outcome.status == zkvote::SessionStatus::kCompleted ? 0 : 2;
  } catch (const std::exception& ex) {
    std::cerr << "zkvote_client failed: " << ex.what() << '\n';
    return 1;
  }
}
