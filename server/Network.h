#pragma once

#include "AttestationProtocol.h"
#include "FragmentStore.h"
#include "Ledger.h"
#include "Module.h"
#include "ReputationLedger.h"
#include "ResultOrError.hpp"
#include "Signer.h"
#include "SoftwareRegistry.h"

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hx {

/**
 * Network - owns one simulated permissioned network
 *
 * Holds the registry, ledger, reputation ledger, fragment store and protocol
 * for a roster of nodes described by config.json, and persists everything
 * that changes to state.bin in the work directory.
 */
class Network : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  struct NodeConfig {
    std::string id;
    std::string version;
    std::string softwareHash; // empty: official build of version
    bool propose{ true };
    bool attest{ true };
    consensus::AttestationStrategy strategy{
      consensus::AttestationStrategy::HONEST
    };
    std::string fakeHash;
    uint64_t latencyMs{ 0 };
    int64_t stake{ 1000 };
    double reputation{ 1.0 };
  };

  struct VersionConfig {
    std::string version;
    std::string hash; // empty: official build hash
  };

  struct Config {
    consensus::AttestationProtocol::Config protocol;
    consensus::ReputationLedger::Config reputation;
    Ledger::Config ledger;
    uint32_t custodiansPerFragment{ 4 };
    std::string keySeed{ "hx-ledger" };
    std::map<std::string, int64_t> initialBalances;
    std::vector<VersionConfig> versions;
    std::vector<NodeConfig> nodes;

    /**
     * Ten honest nodes on version 1.0.0 and two funded accounts
     */
    static Config defaults();
    static Roe<Config> fromJson(const nlohmann::json &json);
    nlohmann::json toJson() const;
  };

  struct Report {
    uint64_t chainLength{ 0 };
    uint64_t committedRounds{ 0 };
    uint64_t abortedRounds{ 0 };
    uint64_t skippedRounds{ 0 };
    double consensusSuccessRate{ 0 };
    uint64_t regenerations{ 0 };
    uint64_t irrecoverableLosses{ 0 };
    uint64_t maliciousNodes{ 0 };
    uint64_t slashEvents{ 0 };
    uint64_t totalNodes{ 0 };
    uint64_t eligibleNodes{ 0 };
    uint64_t offlineNodes{ 0 };
    double networkHealth{ 0 };
    int64_t treasuryBalance{ 0 };
    int64_t totalSupply{ 0 };
    uint64_t pendingTransactions{ 0 };

    nlohmann::json toJson() const;
  };

  static constexpr int32_t E_CONFIG = 1;
  static constexpr int32_t E_VALIDATION = 2;
  static constexpr int32_t E_INTEGRITY = 3;
  static constexpr int32_t E_STATE = 4;
  static constexpr int32_t E_UNKNOWN_NODE = 5;
  static constexpr int32_t E_CONSENSUS = 6;

  static constexpr const char *CONFIG_FILE = "config.json";
  static constexpr const char *STATE_FILE = "state.bin";

  Network();
  explicit Network(std::shared_ptr<const Signer> signer);
  ~Network() override = default;

  /**
   * Fresh genesis network from config
   */
  Roe<void> init(const Config &config);

  /**
   * Load or create <workDir>/config.json, init, then resume from
   * <workDir>/state.bin when present. Returns E_INTEGRITY when the saved
   * chain fails verification; the network is still usable for inspection.
   */
  Roe<void> mount(const std::string &workDir);

  /**
   * Save to <workDir>/state.bin of the mounted work directory
   */
  Roe<void> save() const;

  Roe<void> saveState(const std::string &path) const;
  Roe<void> loadState(const std::string &path);

  // ----- operations -----
  Roe<void> registerVersion(const std::string &version, const std::string &hash);

  /**
   * Buffer a transfer. Transfers sent by a roster node are signed with
   * that node's key.
   */
  Roe<void> addTransaction(const std::string &sender,
                           const std::string &recipient, int64_t amount,
                           const std::string &data);

  Roe<consensus::AttestationProtocol::RoundResult> runRound();

  /**
   * Take nodes offline and regenerate what they held
   */
  Roe<FragmentStore::FailureReport>
  failNodes(const std::vector<std::string> &nodeIds);

  /**
   * Bring nodes back online as empty custodians
   */
  Roe<void> recoverNodes(const std::vector<std::string> &nodeIds);

  Roe<void> verify() const;
  Report getReport() const;

  // ----- accessors -----
  const Config &getConfig() const { return config_; }
  const std::string &getWorkDir() const { return workDir_; }
  Ledger &getLedger() { return *ledger_; }
  const Ledger &getLedger() const { return *ledger_; }
  consensus::SoftwareRegistry &getRegistry() { return *registry_; }
  consensus::ReputationLedger &getReputation() { return *reputation_; }
  const consensus::ReputationLedger &getReputation() const {
    return *reputation_;
  }
  FragmentStore &getFragments() { return *fragments_; }
  const FragmentStore &getFragments() const { return *fragments_; }
  consensus::AttestationProtocol &getProtocol() { return *protocol_; }
  const consensus::AttestationProtocol &getProtocol() const {
    return *protocol_;
  }

private:
  static constexpr uint32_t STATE_MAGIC = 0x48584c53; // "HXLS"
  static constexpr uint32_t STATE_VERSION = 1;

  struct Snapshot {
    uint32_t magic{ STATE_MAGIC };
    uint32_t version{ STATE_VERSION };
    Ledger::State ledger;
    std::map<std::string, std::string> versions;
    std::map<std::string, consensus::ReputationLedger::Entry> reputation;
    std::vector<consensus::ReputationLedger::SlashRecord> slashes;
    FragmentStore::State fragments;
    uint64_t round{ 0 };
    consensus::AttestationProtocol::Metrics metrics;
    std::vector<std::string> offline;

    template <typename Archive> void serialize(Archive &ar) {
      ar & magic & version & ledger & versions & reputation & slashes &
          fragments & round & metrics & offline;
    }
  };

  Roe<void> buildRoster();
  void distributeGenesis();
  bool verifyTransaction(const Ledger::Transaction &tx) const;

  std::shared_ptr<const Signer> signer_;
  Config config_;
  std::string workDir_;

  std::unique_ptr<Ledger> ledger_;
  std::unique_ptr<consensus::SoftwareRegistry> registry_;
  std::unique_ptr<consensus::ReputationLedger> reputation_;
  std::unique_ptr<FragmentStore> fragments_;
  std::unique_ptr<consensus::AttestationProtocol> protocol_;
};

} // namespace hx
