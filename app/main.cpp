#include "Logger.h"
#include "Network.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_OTHER = 1;
constexpr int EXIT_VALIDATION = 2;
constexpr int EXIT_INTEGRITY = 3;

int exitCodeFor(int32_t code) {
  switch (code) {
  case hx::Network::E_VALIDATION:
  case hx::Network::E_UNKNOWN_NODE:
    return EXIT_VALIDATION;
  case hx::Network::E_INTEGRITY:
    return EXIT_INTEGRITY;
  default:
    return EXIT_FAILURE_OTHER;
  }
}

int fail(const hx::Network::Error &error) {
  auto logger = hx::logging::getLogger("hx");
  if (error.code == hx::Network::E_INTEGRITY) {
    logger.critical << error.message;
  }
  std::cerr << "Error: " << error.message << std::endl;
  return exitCodeFor(error.code);
}

void printRound(const hx::consensus::AttestationProtocol::RoundResult &result) {
  using hx::consensus::AttestationProtocol;
  std::cout << "Round " << result.round << ": "
            << AttestationProtocol::stateToString(result.state);
  if (!result.proposerId.empty()) {
    std::cout << " (proposer " << result.proposerId << ")";
  }
  std::cout << "\n";
  if (result.block) {
    std::cout << "  block " << result.block->block.index << " "
              << result.block->hash << " with "
              << result.block->block.transactions.size() << " transaction(s)\n";
  }
  if (result.eligibleCount > 0) {
    std::cout << "  attestations " << result.winningTally << "/"
              << result.eligibleCount << ", quorum " << result.quorum << "\n";
  }
  if (!result.reason.empty()) {
    std::cout << "  reason: " << result.reason << "\n";
  }
  if (!result.slashed.empty()) {
    std::cout << "  slashed: " << hx::utl::join(result.slashed, ", ") << "\n";
  }
  if (!result.timedOut.empty()) {
    std::cout << "  timed out: " << hx::utl::join(result.timedOut, ", ") << "\n";
  }
  if (!result.rejected.empty()) {
    std::cout << "  dropped " << result.rejected.size()
              << " transaction(s) that no longer apply\n";
  }
}

void printReport(const hx::Network::Report &report) {
  std::cout << "Chain length:           " << report.chainLength << "\n"
            << "Committed rounds:       " << report.committedRounds << "\n"
            << "Aborted rounds:         " << report.abortedRounds << "\n"
            << "Skipped rounds:         " << report.skippedRounds << "\n"
            << "Consensus success rate: " << report.consensusSuccessRate << "\n"
            << "Regenerations:          " << report.regenerations << "\n"
            << "Irrecoverable losses:   " << report.irrecoverableLosses << "\n"
            << "Malicious nodes:        " << report.maliciousNodes << "\n"
            << "Slash events:           " << report.slashEvents << "\n"
            << "Nodes (eligible/total): " << report.eligibleNodes << "/"
            << report.totalNodes << " (" << report.offlineNodes << " offline)\n"
            << "Network health:         " << report.networkHealth << "\n"
            << "Treasury balance:       " << report.treasuryBalance << "\n"
            << "Total supply:           " << report.totalSupply << "\n"
            << "Pending transactions:   " << report.pendingTransactions << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"hx-ledger - permissioned attestation ledger"};
  app.require_subcommand(1);

  std::string workDir = ".";
  app.add_option("-d,--work-dir", workDir,
                 "Work directory holding config.json and state.bin");

  bool debugMode = false;
  app.add_flag("--debug", debugMode,
               "Enable debug logging (default: warning level)");

  auto *registerCmd =
      app.add_subcommand("register-version", "Trust a software version");
  std::string version;
  std::string versionHash;
  registerCmd->add_option("version", version, "Version string")->required();
  registerCmd->add_option("--hash", versionHash,
                          "Trusted hash (default: official build hash)");

  auto *txCmd = app.add_subcommand("add-tx", "Buffer a transfer");
  std::string sender;
  std::string recipient;
  int64_t amount = 0;
  std::string data;
  txCmd->add_option("--from", sender, "Sender account")->required();
  txCmd->add_option("--to", recipient, "Recipient account")->required();
  txCmd->add_option("--amount", amount, "Amount")->required();
  txCmd->add_option("--data", data, "Payload bytes");

  auto *roundCmd = app.add_subcommand("run-round", "Run consensus rounds");
  uint64_t rounds = 1;
  roundCmd->add_option("-n,--count", rounds, "Number of rounds");

  auto *failCmd =
      app.add_subcommand("fail-nodes", "Take nodes offline and regenerate");
  std::vector<std::string> failIds;
  failCmd->add_option("nodes", failIds, "Node ids")->required();

  auto *recoverCmd =
      app.add_subcommand("recover-nodes", "Bring nodes back online");
  std::vector<std::string> recoverIds;
  recoverCmd->add_option("nodes", recoverIds, "Node ids")->required();

  auto *reportCmd = app.add_subcommand("report", "Print the performance report");
  bool asJson = false;
  reportCmd->add_flag("--json", asJson, "Print as JSON");

  auto *verifyCmd = app.add_subcommand("verify", "Verify chain integrity");

  app.footer("Example:\n"
             "  hx-ledger -d /path/to/work-dir add-tx --from alice --to bob "
             "--amount 10\n"
             "  hx-ledger -d /path/to/work-dir run-round -n 3\n"
             "\n"
             "A default config.json is created if the work directory has "
             "none.\n");

  CLI11_PARSE(app, argc, argv);

  auto logger = hx::logging::getRootLogger();
  logger.setLevel(debugMode ? hx::logging::Level::DEBUG
                            : hx::logging::Level::WARNING);

  hx::Network network;
  auto mounted = network.mount(workDir);
  // A broken chain is still worth reporting
  if (!mounted && !(mounted.error().code == hx::Network::E_INTEGRITY &&
                    reportCmd->parsed())) {
    return fail(mounted.error());
  }
  logger.addFileHandler(workDir + "/hx-ledger.log", hx::logging::Level::DEBUG);

  if (registerCmd->parsed()) {
    auto result = network.registerVersion(version, versionHash);
    if (!result) {
      return fail(result.error());
    }
    std::cout << "Registered version " << version << "\n";
  } else if (txCmd->parsed()) {
    auto result = network.addTransaction(sender, recipient, amount, data);
    if (!result) {
      return fail(result.error());
    }
    std::cout << "Transaction buffered ("
              << network.getLedger().getPendingCount() << " pending)\n";
  } else if (roundCmd->parsed()) {
    for (uint64_t i = 0; i < rounds; ++i) {
      auto result = network.runRound();
      if (!result) {
        auto saved = network.save();
        if (!saved) {
          std::cerr << "Error: " << saved.error().message << std::endl;
        }
        return fail(result.error());
      }
      printRound(*result);
    }
  } else if (failCmd->parsed()) {
    auto result = network.failNodes(failIds);
    if (!result) {
      return fail(result.error());
    }
    std::cout << "Regenerated " << result->regenerated.size()
              << " member(s), unplaced " << result->unplaced.size()
              << ", irrecoverable " << result->irrecoverable.size() << "\n";
    for (const auto &fragmentId : result->irrecoverable) {
      std::cout << "  lost: " << fragmentId << "\n";
    }
  } else if (recoverCmd->parsed()) {
    auto result = network.recoverNodes(recoverIds);
    if (!result) {
      return fail(result.error());
    }
    std::cout << "Recovered " << recoverIds.size() << " node(s)\n";
  } else if (reportCmd->parsed()) {
    auto report = network.getReport();
    if (asJson) {
      std::cout << report.toJson().dump(2) << std::endl;
    } else {
      printReport(report);
    }
    return mounted ? EXIT_OK : EXIT_INTEGRITY;
  } else if (verifyCmd->parsed()) {
    auto result = network.verify();
    if (!result) {
      return fail(result.error());
    }
    std::cout << "Chain verified: " << network.getLedger().getChainLength()
              << " block(s)\n";
    return EXIT_OK;
  }

  auto saved = network.save();
  if (!saved) {
    return fail(saved.error());
  }
  return EXIT_OK;
}
