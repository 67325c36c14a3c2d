#include "Network.h"
#include "BinaryPack.hpp"
#include "Utilities.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <type_traits>

namespace hx {

namespace {

// Optional typed field readers; a present field of the wrong type is an error
template <typename T>
bool readField(const nlohmann::json &json, const char *key, T &value,
               std::string &error) {
  if (!json.contains(key)) {
    return true;
  }
  const auto &field = json[key];
  bool ok = false;
  if constexpr (std::is_same<T, bool>::value) {
    ok = field.is_boolean();
  } else if constexpr (std::is_same<T, std::string>::value) {
    ok = field.is_string();
  } else if constexpr (std::is_floating_point<T>::value) {
    ok = field.is_number();
  } else if constexpr (std::is_unsigned<T>::value) {
    ok = field.is_number_unsigned() ||
         (field.is_number_integer() && field.get<int64_t>() >= 0);
  } else {
    ok = field.is_number_integer();
  }
  if (!ok) {
    error = std::string("Invalid value for '") + key + "'";
    return false;
  }
  value = field.get<T>();
  return true;
}

} // namespace

// ----- Config -----

Network::Config Network::Config::defaults() {
  Config config;
  config.initialBalances["alice"] = 1000;
  config.initialBalances["bob"] = 500;
  VersionConfig version;
  version.version = "1.0.0";
  config.versions.push_back(version);
  for (int i = 0; i < 10; ++i) {
    NodeConfig node;
    node.id = "node-" + std::to_string(i);
    node.version = "1.0.0";
    config.nodes.push_back(node);
  }
  return config;
}

Network::Roe<Network::Config>
Network::Config::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  Config config;
  std::string error;
  auto &protocol = config.protocol;
  auto &reputation = config.reputation;
  bool ok = readField(json, "reputationFloor", protocol.reputationFloor, error) &&
            readField(json, "blockReward", protocol.blockReward, error) &&
            readField(json, "proposerRewardShare", protocol.proposerRewardShare, error) &&
            readField(json, "proposerReputationIncrement",
                      protocol.proposerReputationIncrement, error) &&
            readField(json, "attesterReputationIncrement",
                      protocol.attesterReputationIncrement, error) &&
            readField(json, "maxTransactionsPerBlock",
                      protocol.maxTransactionsPerBlock, error) &&
            readField(json, "attestationTimeoutMs", protocol.attestationTimeoutMs,
                      error) &&
            readField(json, "slashOnTimeout", protocol.slashOnTimeout, error) &&
            readField(json, "redundancy", protocol.redundancy, error) &&
            readField(json, "slashPenalty", reputation.slashPenalty, error) &&
            readField(json, "slashReputationDecrement",
                      reputation.slashReputationDecrement, error) &&
            readField(json, "treasuryAccount", reputation.treasuryAccount, error) &&
            readField(json, "issuanceSender", config.ledger.issuanceSender, error) &&
            readField(json, "genesisTime", config.ledger.genesisTime, error) &&
            readField(json, "custodiansPerFragment", config.custodiansPerFragment,
                      error) &&
            readField(json, "keySeed", config.keySeed, error);
  if (!ok) {
    return Error(E_CONFIG, error);
  }
  if (protocol.proposerRewardShare < 0 || protocol.proposerRewardShare > 1) {
    return Error(E_CONFIG, "proposerRewardShare must be within [0, 1]");
  }
  if (protocol.blockReward < 0 || reputation.slashPenalty < 0) {
    return Error(E_CONFIG, "blockReward and slashPenalty must not be negative");
  }
  if (protocol.redundancy == 0) {
    return Error(E_CONFIG, "redundancy must be at least 1");
  }

  if (json.contains("initialBalances")) {
    const auto &balances = json["initialBalances"];
    if (!balances.is_object()) {
      return Error(E_CONFIG, "initialBalances must be an object");
    }
    for (auto it = balances.begin(); it != balances.end(); ++it) {
      if (!it.value().is_number_integer() || it.value().get<int64_t>() < 0) {
        return Error(E_CONFIG, "Invalid initial balance for " + it.key());
      }
      config.initialBalances[it.key()] = it.value().get<int64_t>();
    }
  }

  if (json.contains("versions")) {
    if (!json["versions"].is_array()) {
      return Error(E_CONFIG, "versions must be an array");
    }
    for (const auto &item : json["versions"]) {
      VersionConfig version;
      if (!item.is_object() || !readField(item, "version", version.version, error) ||
          !readField(item, "hash", version.hash, error) || version.version.empty()) {
        return Error(E_CONFIG, "Invalid versions entry: " + item.dump());
      }
      config.versions.push_back(version);
    }
  }

  if (json.contains("nodes")) {
    if (!json["nodes"].is_array()) {
      return Error(E_CONFIG, "nodes must be an array");
    }
    for (const auto &item : json["nodes"]) {
      NodeConfig node;
      std::string strategy = "honest";
      if (!item.is_object()) {
        return Error(E_CONFIG, "Invalid nodes entry: " + item.dump());
      }
      ok = readField(item, "id", node.id, error) &&
           readField(item, "version", node.version, error) &&
           readField(item, "softwareHash", node.softwareHash, error) &&
           readField(item, "propose", node.propose, error) &&
           readField(item, "attest", node.attest, error) &&
           readField(item, "strategy", strategy, error) &&
           readField(item, "fakeHash", node.fakeHash, error) &&
           readField(item, "latencyMs", node.latencyMs, error) &&
           readField(item, "stake", node.stake, error) &&
           readField(item, "reputation", node.reputation, error);
      if (!ok) {
        return Error(E_CONFIG, "Node entry: " + error);
      }
      if (node.id.empty()) {
        return Error(E_CONFIG, "Node entry without id: " + item.dump());
      }
      if (!consensus::strategyFromString(strategy, node.strategy)) {
        return Error(E_CONFIG, "Unknown strategy '" + strategy + "' for " + node.id);
      }
      if (node.stake < 0) {
        return Error(E_CONFIG, "Negative stake for " + node.id);
      }
      config.nodes.push_back(node);
    }
  }
  return config;
}

nlohmann::json Network::Config::toJson() const {
  nlohmann::json j;
  j["reputationFloor"] = protocol.reputationFloor;
  j["slashPenalty"] = reputation.slashPenalty;
  j["slashReputationDecrement"] = reputation.slashReputationDecrement;
  j["blockReward"] = protocol.blockReward;
  j["proposerRewardShare"] = protocol.proposerRewardShare;
  j["proposerReputationIncrement"] = protocol.proposerReputationIncrement;
  j["attesterReputationIncrement"] = protocol.attesterReputationIncrement;
  j["maxTransactionsPerBlock"] = protocol.maxTransactionsPerBlock;
  j["attestationTimeoutMs"] = protocol.attestationTimeoutMs;
  j["slashOnTimeout"] = protocol.slashOnTimeout;
  j["redundancy"] = protocol.redundancy;
  j["custodiansPerFragment"] = custodiansPerFragment;
  j["treasuryAccount"] = reputation.treasuryAccount;
  j["issuanceSender"] = ledger.issuanceSender;
  j["keySeed"] = keySeed;
  j["genesisTime"] = ledger.genesisTime;
  j["initialBalances"] = initialBalances;

  j["versions"] = nlohmann::json::array();
  for (const auto &version : versions) {
    nlohmann::json v;
    v["version"] = version.version;
    if (!version.hash.empty()) {
      v["hash"] = version.hash;
    }
    j["versions"].push_back(v);
  }

  j["nodes"] = nlohmann::json::array();
  for (const auto &node : nodes) {
    nlohmann::json n;
    n["id"] = node.id;
    n["version"] = node.version;
    if (!node.softwareHash.empty()) {
      n["softwareHash"] = node.softwareHash;
    }
    n["propose"] = node.propose;
    n["attest"] = node.attest;
    n["strategy"] = consensus::strategyToString(node.strategy);
    if (!node.fakeHash.empty()) {
      n["fakeHash"] = node.fakeHash;
    }
    n["latencyMs"] = node.latencyMs;
    n["stake"] = node.stake;
    n["reputation"] = node.reputation;
    j["nodes"].push_back(n);
  }
  return j;
}

nlohmann::json Network::Report::toJson() const {
  nlohmann::json j;
  j["chainLength"] = chainLength;
  j["committedRounds"] = committedRounds;
  j["abortedRounds"] = abortedRounds;
  j["skippedRounds"] = skippedRounds;
  j["consensusSuccessRate"] = consensusSuccessRate;
  j["regenerations"] = regenerations;
  j["irrecoverableLosses"] = irrecoverableLosses;
  j["maliciousNodes"] = maliciousNodes;
  j["slashEvents"] = slashEvents;
  j["totalNodes"] = totalNodes;
  j["eligibleNodes"] = eligibleNodes;
  j["offlineNodes"] = offlineNodes;
  j["networkHealth"] = networkHealth;
  j["treasuryBalance"] = treasuryBalance;
  j["totalSupply"] = totalSupply;
  j["pendingTransactions"] = pendingTransactions;
  return j;
}

// ----- Network -----

Network::Network() : Network(std::make_shared<Ed25519Signer>()) {}

Network::Network(std::shared_ptr<const Signer> signer)
    : Module("server.network"), signer_(std::move(signer)) {
  if (!signer_) {
    throw std::invalid_argument("Network requires a signer");
  }
  auto result = init(Config{});
  if (!result) {
    throw std::runtime_error("Failed to initialize empty network: " +
                             result.error().message);
  }
}

Network::Roe<void> Network::init(const Config &config) {
  config_ = config;

  protocol_.reset();
  ledger_ = std::make_unique<Ledger>();
  registry_ = std::make_unique<consensus::SoftwareRegistry>();
  reputation_ = std::make_unique<consensus::ReputationLedger>(*ledger_, *registry_);
  fragments_ = std::make_unique<FragmentStore>();
  protocol_ = std::make_unique<consensus::AttestationProtocol>(
      *ledger_, *registry_, *reputation_, *fragments_, signer_);

  ledger_->init(config_.ledger);
  ledger_->setVerifier(
      [this](const Ledger::Transaction &tx) { return verifyTransaction(tx); });
  reputation_->setConfig(config_.reputation);
  protocol_->setConfig(config_.protocol);

  for (const auto &version : config_.versions) {
    auto registered = version.hash.empty()
                          ? registry_->registerOfficialVersion(version.version)
                          : registry_->registerVersion(version.version, version.hash);
    if (!registered) {
      return Error(E_CONFIG, registered.error().message);
    }
  }

  for (const auto &item : config_.initialBalances) {
    auto credited = ledger_->credit(item.first, item.second);
    if (!credited) {
      return Error(E_CONFIG, "Initial balance of " + item.first + ": " +
                                 credited.error().message);
    }
  }

  auto roster = buildRoster();
  if (!roster) {
    return roster;
  }
  distributeGenesis();

  log().info << "Network initialized: " << config_.nodes.size() << " node(s), "
             << config_.versions.size() << " trusted version(s), genesis "
             << ledger_->getLastHash();
  return {};
}

Network::Roe<void> Network::buildRoster() {
  for (const auto &nodeConfig : config_.nodes) {
    auto keys = signer_->deriveKeyPair(config_.keySeed + ":" + nodeConfig.id);
    if (!keys) {
      return Error(E_CONFIG, "Failed to derive keys for " + nodeConfig.id + ": " +
                                 keys.error().message);
    }

    consensus::Node node;
    node.id = nodeConfig.id;
    node.version = nodeConfig.version;
    node.softwareHash =
        nodeConfig.softwareHash.empty()
            ? consensus::SoftwareRegistry::softwareHashFor(nodeConfig.version)
            : nodeConfig.softwareHash;
    node.canPropose = nodeConfig.propose;
    node.canAttest = nodeConfig.attest;
    node.strategy = nodeConfig.strategy;
    node.fakeHash = nodeConfig.fakeHash;
    node.latencyMs = nodeConfig.latencyMs;
    node.publicKey = keys->publicKey;
    node.privateKey = keys->privateKey;

    auto added = protocol_->addNode(node);
    if (!added) {
      return Error(E_CONFIG, added.error().message);
    }
    auto registered = reputation_->registerNode(node.id, nodeConfig.stake,
                                                nodeConfig.reputation);
    if (!registered) {
      return Error(E_CONFIG, registered.error().message);
    }
    fragments_->addCustodian(node.id);
  }
  return {};
}

void Network::distributeGenesis() {
  std::vector<std::string> targets;
  for (const auto &node : config_.nodes) {
    if (targets.size() >= config_.custodiansPerFragment) {
      break;
    }
    targets.push_back(node.id);
  }
  if (targets.size() < 2) {
    log().warning << "Genesis block not distributed: " << targets.size()
                  << " custodian(s)";
    return;
  }

  auto genesis = ledger_->getLastBlock();
  auto fragment = FragmentStore::Fragment::create(
      "block-0", genesis.block.ltsToString(), config_.protocol.redundancy);
  auto distributed = fragments_->distribute(fragment, targets);
  if (!distributed) {
    log().error << "Failed to distribute genesis block: "
                << distributed.error().message;
  }
}

bool Network::verifyTransaction(const Ledger::Transaction &tx) const {
  // Only roster nodes hold keys; other accounts are operator-managed
  auto node = protocol_->getNode(tx.sender);
  if (!node) {
    return true;
  }
  return signer_->verify(tx.getHash(), tx.signature, node->publicKey);
}

Network::Roe<void> Network::mount(const std::string &workDir) {
  workDir_ = workDir;
  std::filesystem::path configPath = std::filesystem::path(workDir) / CONFIG_FILE;

  if (!std::filesystem::exists(configPath)) {
    log().info << "No " << CONFIG_FILE << " found, creating with default values";
    auto written =
        utl::writeFile(configPath.string(), Config::defaults().toJson().dump(2) + "\n");
    if (!written) {
      return Error(E_CONFIG, "Failed to create " + configPath.string() + ": " +
                                 written.error().message);
    }
  }

  auto jsonResult = utl::loadJsonFile(configPath.string());
  if (!jsonResult) {
    return Error(E_CONFIG, jsonResult.error().message);
  }
  auto config = Config::fromJson(*jsonResult);
  if (!config) {
    return Error(E_CONFIG, configPath.string() + ": " + config.error().message);
  }

  auto initialized = init(*config);
  if (!initialized) {
    return initialized;
  }
  return loadState((std::filesystem::path(workDir) / STATE_FILE).string());
}

Network::Roe<void> Network::save() const {
  if (workDir_.empty()) {
    return Error(E_STATE, "No work directory mounted");
  }
  return saveState((std::filesystem::path(workDir_) / STATE_FILE).string());
}

Network::Roe<void> Network::saveState(const std::string &path) const {
  Snapshot snapshot;
  snapshot.ledger = ledger_->exportState();
  snapshot.versions = registry_->getVersions();
  snapshot.reputation = reputation_->getEntries();
  snapshot.slashes = reputation_->getSlashHistory();
  snapshot.fragments = fragments_->exportState();
  snapshot.round = protocol_->getRoundIndex();
  snapshot.metrics = protocol_->getMetrics();
  snapshot.offline = protocol_->getOfflineNodes();

  auto written = utl::writeFile(path, utl::binaryPack(snapshot));
  if (!written) {
    return Error(E_STATE, "Failed to save state to " + path + ": " +
                              written.error().message);
  }
  log().debug << "Saved state to " << path << " (chain length "
              << snapshot.ledger.chain.size() << ")";
  return {};
}

Network::Roe<void> Network::loadState(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    log().info << "No saved state at " << path << ", starting from genesis";
    return {};
  }
  auto bytes = utl::readFile(path);
  if (!bytes) {
    log().error << "Cannot read " << path << ": " << bytes.error().message
                << "; starting from genesis";
    return {};
  }
  auto snapshot = utl::binaryUnpack<Snapshot>(*bytes);
  if (!snapshot || snapshot->magic != STATE_MAGIC ||
      snapshot->version != STATE_VERSION) {
    log().error << "Corrupt state file " << path << "; starting from genesis";
    return {};
  }

  ledger_->restore(snapshot->ledger);
  registry_->restore(snapshot->versions);
  reputation_->restore(snapshot->reputation, snapshot->slashes);
  fragments_->restore(snapshot->fragments);
  protocol_->setRoundIndex(snapshot->round);
  protocol_->setMetrics(snapshot->metrics);
  for (const auto &nodeId : snapshot->offline) {
    auto offline = protocol_->setOnline(nodeId, false);
    if (!offline) {
      log().warning << "Saved state names unknown node " << nodeId;
    }
  }
  log().info << "Resumed from " << path << ": chain length "
             << ledger_->getChainLength() << ", round " << snapshot->round;

  auto verified = ledger_->verifyIntegrity();
  if (!verified) {
    return Error(E_INTEGRITY, verified.error().message);
  }
  return {};
}

// ----- operations -----

Network::Roe<void> Network::registerVersion(const std::string &version,
                                            const std::string &hash) {
  auto registered = hash.empty() ? registry_->registerOfficialVersion(version)
                                 : registry_->registerVersion(version, hash);
  if (!registered) {
    return Error(E_VALIDATION, registered.error().message);
  }
  return {};
}

Network::Roe<void> Network::addTransaction(const std::string &sender,
                                           const std::string &recipient,
                                           int64_t amount,
                                           const std::string &data) {
  Ledger::Transaction tx;
  tx.sender = sender;
  tx.recipient = recipient;
  tx.amount = amount;
  tx.timestamp = utl::getCurrentTime();
  tx.setData(data);

  auto node = protocol_->getNode(sender);
  if (node) {
    auto signature = signer_->sign(tx.getHash(), node->privateKey);
    if (!signature) {
      return Error(E_VALIDATION, "Failed to sign transaction of " + sender +
                                     ": " + signature.error().message);
    }
    tx.signature = *signature;
  }

  auto added = ledger_->addTransaction(tx);
  if (!added) {
    return Error(E_VALIDATION, added.error().message);
  }
  log().info << "Buffered " << amount << " from " << sender << " to "
             << recipient << " (" << ledger_->getPendingCount() << " pending)";
  return {};
}

Network::Roe<consensus::AttestationProtocol::RoundResult> Network::runRound() {
  auto result = protocol_->runRound();
  if (!result) {
    return Error(E_CONSENSUS, result.error().message);
  }
  return *result;
}

Network::Roe<FragmentStore::FailureReport>
Network::failNodes(const std::vector<std::string> &nodeIds) {
  for (const auto &nodeId : nodeIds) {
    if (!protocol_->getNode(nodeId)) {
      return Error(E_UNKNOWN_NODE, "Unknown node: " + nodeId);
    }
  }
  for (const auto &nodeId : nodeIds) {
    auto offline = protocol_->setOnline(nodeId, false);
    if (!offline) {
      return Error(E_UNKNOWN_NODE, offline.error().message);
    }
  }
  auto report = fragments_->onNodeFailure(nodeIds);
  log().info << "Failed " << nodeIds.size() << " node(s): "
             << report.regenerated.size() << " member(s) regenerated, "
             << report.irrecoverable.size() << " fragment(s) lost";
  return report;
}

Network::Roe<void> Network::recoverNodes(const std::vector<std::string> &nodeIds) {
  for (const auto &nodeId : nodeIds) {
    if (!protocol_->getNode(nodeId)) {
      return Error(E_UNKNOWN_NODE, "Unknown node: " + nodeId);
    }
  }
  for (const auto &nodeId : nodeIds) {
    auto online = protocol_->setOnline(nodeId, true);
    if (!online) {
      return Error(E_UNKNOWN_NODE, online.error().message);
    }
    fragments_->addCustodian(nodeId);
  }
  return {};
}

Network::Roe<void> Network::verify() const {
  auto verified = ledger_->verifyIntegrity();
  if (!verified) {
    return Error(E_INTEGRITY, verified.error().message);
  }
  return {};
}

Network::Report Network::getReport() const {
  Report report;
  auto metrics = protocol_->getMetrics();
  report.chainLength = ledger_->getChainLength();
  report.committedRounds = metrics.committed;
  report.abortedRounds = metrics.aborted;
  report.skippedRounds = metrics.skipped;
  uint64_t decided = metrics.committed + metrics.aborted;
  report.consensusSuccessRate =
      decided == 0 ? 0.0
                   : static_cast<double>(metrics.committed) /
                         static_cast<double>(decided);
  report.regenerations = fragments_->getRegenerationCount();
  report.irrecoverableLosses = fragments_->getIrrecoverableCount();
  report.maliciousNodes = reputation_->getMaliciousNodes().size();
  report.slashEvents = reputation_->getSlashEventCount();
  report.totalNodes = protocol_->getNodes().size();
  report.eligibleNodes = protocol_->getEligibleAttesters().size();
  report.offlineNodes = protocol_->getOfflineNodes().size();
  report.networkHealth = reputation_->getMeanReputation();
  report.treasuryBalance = ledger_->getBalance(config_.reputation.treasuryAccount);
  report.totalSupply = ledger_->getTotalSupply();
  report.pendingTransactions = ledger_->getPendingCount();
  return report;
}

} // namespace hx
