#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "zkvote/common/logging.hpp"
#include "zkvote/protocol/config.hpp"
#include "zkvote/protocol/session_state.hpp"
#include "zkvote/protocol/voting_server.hpp"

namespace {

using zkvote::ServerConfig;
using zkvote::VerificationReport;
using zkvote::VotingServer;

std::atomic<VotingServer*> g_server{nullptr};

void HandleSignal(int /*signum*/) {
  VotingServer* server = g_server.load();
  if (server != nullptr) {
    server->RequestShutdown();
  }
}

struct ServerArgs {
  ServerConfig config;
  zkvote::LogLevel log_level = boost::log::trivial::info;
};

uint64_t ParsePositiveU64(const char* value, const char* flag, uint64_t max) {
  try {
    const unsigned long long parsed = std::stoull(value);
    if (parsed == 0 || parsed > max) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint64_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

void PrintUsage() {
  std::cout << "Usage: zkvote_server [--host H] [--port P] [--max-voters N]\n"
               "                     [--key-timeout-ms MS] [--challenge-timeout-ms MS]\n"
               "                     [--keep-running] [--log-level LEVEL]\n";
}

ServerArgs ParseArgs(int argc, char** argv) {
  ServerArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--host" && i + 1 < argc) {
      args.config.host = argv[++i];
    } else if (flag == "--port" && i + 1 < argc) {
      args.config.port = static_cast<uint16_t>(ParsePositiveU64(argv[++i], "--port", UINT16_MAX));
    } else if (flag == "--max-voters" && i + 1 < argc) {
      args.config.max_voters = ParsePositiveU64(argv[++i], "--max-voters", UINT32_MAX);
    } else if (flag == "--key-timeout-ms" && i + 1 < argc) {
      args.config.key_exchange_timeout =
          std::chrono::milliseconds(ParsePositiveU64(argv[++i], "--key-timeout-ms", INT32_MAX));
    } else if (flag == "--challenge-timeout-ms" && i + 1 < argc) {
      args.config.challenge_response_timeout = std::chrono::milliseconds(
          ParsePositiveU64(argv[++i], "--challenge-timeout-ms", INT32_MAX));
    } else if (flag == "--keep-running") {
      args.config.shutdown_on_completion = false;
    } else if (flag == "--log-level" && i + 1 < argc) {
      args.log_level = zkvote::ParseLogLevel(argv[++i]);
    } else if (flag == "--help") {
      PrintUsage();
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }
  return args;
}

void PrintReport(const VerificationReport& report) {
  std::cout << "\n[Verification]\n";
  for (const zkvote::VoterVerification& voter : report.voters) {
    std::cout << voter.client_id << "  " << zkvote::VerificationOutcomeName(voter.outcome)
              << '\n';
  }
  std::cout << "fraud flags: " << report.fraud_count() << '\n';
  if (report.tally.has_value()) {
    std::cout << "tally: " << report.tally->get_str() << " ("
              << zkvote::TallyOutcomeName(*report.tally_outcome) << ")\n";
  } else {
    std::cout << "tally: not reported\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const ServerArgs args = ParseArgs(argc, argv);
    zkvote::InitLogging(args.log_level);

    VotingServer server(args.config);
    server.Start();
    std::cout << "zkvote server on " << args.config.host << ":" << server.port() << '\n';

    g_server.store(&server);
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    server.Run();
    g_server.store(nullptr);

    PrintReport(server.report());
  } catch (const std::exception& ex) {
    std::cerr << "zkvote_server failed: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
