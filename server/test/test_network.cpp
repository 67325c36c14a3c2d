#include "../Network.h"
#include "Utilities.h"

#include <gtest/gtest.h>

#include <filesystem>

using namespace hx;

namespace {

std::filesystem::path freshDir(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

Network::Config smallConfig(size_t honest, size_t byzantine) {
  auto config = Network::Config::defaults();
  config.nodes.clear();
  for (size_t i = 0; i < honest + byzantine; ++i) {
    Network::NodeConfig node;
    node.id = "node-" + std::to_string(i);
    node.version = "1.0.0";
    if (i >= honest) {
      node.strategy = consensus::AttestationStrategy::BYZANTINE;
    }
    config.nodes.push_back(node);
  }
  return config;
}

} // namespace

TEST(NetworkConfigTest, DefaultsDescribeTenHonestNodes) {
  auto config = Network::Config::defaults();
  ASSERT_EQ(config.nodes.size(), 10u);
  EXPECT_EQ(config.nodes[0].id, "node-0");
  EXPECT_EQ(config.nodes[9].id, "node-9");
  for (const auto &node : config.nodes) {
    EXPECT_EQ(node.strategy, consensus::AttestationStrategy::HONEST);
    EXPECT_TRUE(node.propose);
    EXPECT_TRUE(node.attest);
  }
  ASSERT_EQ(config.versions.size(), 1u);
  EXPECT_EQ(config.versions[0].version, "1.0.0");
  EXPECT_EQ(config.initialBalances.at("alice"), 1000);
}

TEST(NetworkConfigTest, JsonRoundTripKeepsRoster) {
  auto config = smallConfig(3, 1);
  config.nodes[1].latencyMs = 25;
  config.protocol.slashOnTimeout = true;

  auto parsed = Network::Config::fromJson(config.toJson());
  ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
  ASSERT_EQ(parsed->nodes.size(), 4u);
  EXPECT_EQ(parsed->nodes[3].strategy, consensus::AttestationStrategy::BYZANTINE);
  EXPECT_EQ(parsed->nodes[1].latencyMs, 25u);
  EXPECT_TRUE(parsed->protocol.slashOnTimeout);
  EXPECT_EQ(parsed->initialBalances, config.initialBalances);
}

TEST(NetworkConfigTest, PartialJsonKeepsDefaults) {
  auto parsed = Network::Config::fromJson(
      nlohmann::json::parse(R"({"blockReward": 50, "nodes": [{"id": "a"}]})"));
  ASSERT_TRUE(parsed.isOk());
  EXPECT_EQ(parsed->protocol.blockReward, 50);
  EXPECT_DOUBLE_EQ(parsed->protocol.reputationFloor, 0.5);
  EXPECT_EQ(parsed->reputation.slashPenalty, 100);
  ASSERT_EQ(parsed->nodes.size(), 1u);
  EXPECT_EQ(parsed->nodes[0].stake, 1000);
}

TEST(NetworkConfigTest, RejectsMalformedFields) {
  const char *cases[] = {
    R"([])",
    R"({"blockReward": "100"})",
    R"({"proposerRewardShare": 1.5})",
    R"({"redundancy": 0})",
    R"({"initialBalances": {"alice": -5}})",
    R"({"nodes": [{"version": "1.0.0"}]})",
    R"({"nodes": [{"id": "a", "strategy": "sneaky"}]})",
    R"({"nodes": [{"id": "a", "stake": -1}]})",
    R"({"versions": [{"hash": "abc"}]})",
  };
  for (const char *text : cases) {
    auto parsed = Network::Config::fromJson(nlohmann::json::parse(text));
    ASSERT_TRUE(parsed.isError()) << text;
    EXPECT_EQ(parsed.error().code, Network::E_CONFIG) << text;
  }
}

class NetworkTest : public ::testing::Test {
protected:
  void SetUp() override { dir_ = freshDir("hx_network_test"); }
  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

TEST_F(NetworkTest, MountCreatesDefaultConfig) {
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  EXPECT_TRUE(std::filesystem::exists(dir_ / Network::CONFIG_FILE));
  EXPECT_FALSE(std::filesystem::exists(dir_ / Network::STATE_FILE));

  EXPECT_EQ(network.getLedger().getChainLength(), 1u);
  EXPECT_EQ(network.getLedger().getBalance("alice"), 1000);
  EXPECT_EQ(network.getProtocol().getNodes().size(), 10u);

  // Genesis block sits with the first four roster nodes
  auto group = network.getFragments().getGroup("block-0");
  ASSERT_TRUE(group.isOk());
  EXPECT_EQ(group->members.size(), 4u);
  auto payload = network.getFragments().retrieve("block-0");
  ASSERT_TRUE(payload.isOk());
  EXPECT_EQ(*payload, network.getLedger().getLastBlock().block.ltsToString());
}

TEST_F(NetworkTest, MountRejectsBrokenConfig) {
  ASSERT_TRUE(utl::writeFile((dir_ / Network::CONFIG_FILE).string(),
                             "{ not json").isOk());
  Network network;
  auto mounted = network.mount(dir_.string());
  ASSERT_TRUE(mounted.isError());
  EXPECT_EQ(mounted.error().code, Network::E_CONFIG);
}

TEST_F(NetworkTest, TransferCommitsAndSurvivesRestart) {
  {
    Network network;
    ASSERT_TRUE(network.mount(dir_.string()).isOk());
    ASSERT_TRUE(network.addTransaction("alice", "bob", 10, "hello").isOk());
    auto round = network.runRound();
    ASSERT_TRUE(round.isOk()) << round.error().message;
    EXPECT_EQ(round->state, consensus::AttestationProtocol::State::COMMITTED);
    ASSERT_TRUE(network.save().isOk());
  }

  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  const auto &ledger = network.getLedger();
  EXPECT_EQ(ledger.getChainLength(), 2u);
  EXPECT_EQ(ledger.getBalance("alice"), 990);
  EXPECT_EQ(ledger.getBalance("bob"), 510);
  EXPECT_EQ(network.getProtocol().getRoundIndex(), 1u);
  EXPECT_EQ(network.getProtocol().getMetrics().committed, 1u);
  EXPECT_TRUE(network.getFragments().hasFragment("block-1"));

  auto block = ledger.getBlock(1);
  ASSERT_TRUE(block.isOk());
  ASSERT_EQ(block->block.transactions.size(), 1u);
  auto data = block->block.transactions[0].getData();
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(*data, "hello");
  EXPECT_TRUE(network.verify().isOk());
}

TEST_F(NetworkTest, InvalidTransferIsValidationError) {
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  auto overdraft = network.addTransaction("bob", "alice", 501, "");
  ASSERT_TRUE(overdraft.isError());
  EXPECT_EQ(overdraft.error().code, Network::E_VALIDATION);
  auto zero = network.addTransaction("alice", "bob", 0, "");
  ASSERT_TRUE(zero.isError());
  EXPECT_EQ(zero.error().code, Network::E_VALIDATION);
  EXPECT_EQ(network.getLedger().getPendingCount(), 0u);
}

TEST_F(NetworkTest, NodeTransfersMustBeSigned) {
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  ASSERT_TRUE(network.addTransaction("alice", "bob", 10, "").isOk());
  ASSERT_TRUE(network.runRound().isOk());
  // Proposer reward: 20 plus an equal share of 80 over ten attesters
  ASSERT_EQ(network.getLedger().getBalance("node-0"), 28);

  EXPECT_TRUE(network.addTransaction("node-0", "bob", 5, "").isOk());

  Ledger::Transaction forged;
  forged.sender = "node-0";
  forged.recipient = "alice";
  forged.amount = 5;
  forged.timestamp = utl::getCurrentTime();
  EXPECT_TRUE(network.getLedger().addTransaction(forged).isError());
}

TEST_F(NetworkTest, RegisterVersionValidatesHash) {
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  EXPECT_TRUE(network.registerVersion("2.0.0", "").isOk());
  EXPECT_TRUE(network.getRegistry().hasVersion("2.0.0"));
  auto bad = network.registerVersion("2.1.0", "not-a-hash");
  ASSERT_TRUE(bad.isError());
  EXPECT_EQ(bad.error().code, Network::E_VALIDATION);
}

TEST_F(NetworkTest, CorruptStateStartsFromGenesis) {
  ASSERT_TRUE(utl::writeFile((dir_ / Network::STATE_FILE).string(),
                             "definitely not a snapshot").isOk());
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  EXPECT_EQ(network.getLedger().getChainLength(), 1u);
  EXPECT_EQ(network.getProtocol().getRoundIndex(), 0u);
}

TEST_F(NetworkTest, TamperedStateIsIntegrityError) {
  {
    Network network;
    ASSERT_TRUE(network.mount(dir_.string()).isOk());
    ASSERT_TRUE(network.addTransaction("alice", "bob", 10, "").isOk());
    ASSERT_TRUE(network.runRound().isOk());

    auto state = network.getLedger().exportState();
    ASSERT_EQ(state.chain.size(), 2u);
    state.chain[1].block.transactions[0].amount = 1000;
    network.getLedger().restore(state);
    ASSERT_TRUE(network.save().isOk());
  }

  Network network;
  auto mounted = network.mount(dir_.string());
  ASSERT_TRUE(mounted.isError());
  EXPECT_EQ(mounted.error().code, Network::E_INTEGRITY);
  EXPECT_NE(mounted.error().message.find("block 1"), std::string::npos);

  // Still inspectable
  EXPECT_EQ(network.getReport().chainLength, 2u);
  EXPECT_EQ(network.verify().error().code, Network::E_INTEGRITY);
}

TEST_F(NetworkTest, FailNodesRegeneratesGenesis) {
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());

  auto report = network.failNodes({ "node-0", "node-1" });
  ASSERT_TRUE(report.isOk());
  EXPECT_EQ(report->regenerated.size(), 2u);
  EXPECT_TRUE(report->irrecoverable.empty());
  for (const auto &placement : report->regenerated) {
    EXPECT_NE(placement.nodeId, "node-0");
    EXPECT_NE(placement.nodeId, "node-1");
  }

  auto payload = network.getFragments().retrieve("block-0");
  ASSERT_TRUE(payload.isOk());
  EXPECT_EQ(*payload, network.getLedger().getLastBlock().block.ltsToString());

  auto summary = network.getReport();
  EXPECT_EQ(summary.regenerations, 2u);
  EXPECT_EQ(summary.offlineNodes, 2u);

  ASSERT_TRUE(network.recoverNodes({ "node-0" }).isOk());
  EXPECT_TRUE(network.getProtocol().isOnline("node-0"));
  EXPECT_TRUE(network.getFragments().isCustodian("node-0"));
  EXPECT_EQ(network.getReport().offlineNodes, 1u);
}

TEST_F(NetworkTest, UnknownNodeIsRejected) {
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  auto failed = network.failNodes({ "node-1", "ghost" });
  ASSERT_TRUE(failed.isError());
  EXPECT_EQ(failed.error().code, Network::E_UNKNOWN_NODE);
  // Nothing happened to the known node either
  EXPECT_TRUE(network.getProtocol().isOnline("node-1"));
  EXPECT_EQ(network.recoverNodes({ "ghost" }).error().code,
            Network::E_UNKNOWN_NODE);
}

TEST_F(NetworkTest, OfflineStateIsPersisted) {
  {
    Network network;
    ASSERT_TRUE(network.mount(dir_.string()).isOk());
    ASSERT_TRUE(network.failNodes({ "node-5" }).isOk());
    ASSERT_TRUE(network.save().isOk());
  }
  Network network;
  ASSERT_TRUE(network.mount(dir_.string()).isOk());
  EXPECT_FALSE(network.getProtocol().isOnline("node-5"));
  EXPECT_FALSE(network.getFragments().isCustodian("node-5"));
}

TEST_F(NetworkTest, ReportReflectsByzantineRound) {
  Network network;
  ASSERT_TRUE(network.init(smallConfig(7, 3)).isOk());
  ASSERT_TRUE(network.addTransaction("alice", "bob", 10, "").isOk());
  auto round = network.runRound();
  ASSERT_TRUE(round.isOk());
  EXPECT_EQ(round->state, consensus::AttestationProtocol::State::COMMITTED);
  auto skipped = network.runRound();
  ASSERT_TRUE(skipped.isOk());
  EXPECT_EQ(skipped->state, consensus::AttestationProtocol::State::SKIPPED);

  auto report = network.getReport();
  EXPECT_EQ(report.chainLength, 2u);
  EXPECT_EQ(report.committedRounds, 1u);
  EXPECT_EQ(report.abortedRounds, 0u);
  EXPECT_EQ(report.skippedRounds, 1u);
  EXPECT_DOUBLE_EQ(report.consensusSuccessRate, 1.0);
  EXPECT_EQ(report.maliciousNodes, 3u);
  EXPECT_EQ(report.slashEvents, 3u);
  EXPECT_EQ(report.treasuryBalance, 300);
  EXPECT_EQ(report.totalNodes, 10u);
  EXPECT_EQ(report.eligibleNodes, 10u);
  EXPECT_DOUBLE_EQ(report.networkHealth, (7 * 1.0 + 3 * 0.5) / 10);

  auto json = report.toJson();
  EXPECT_EQ(json["treasuryBalance"], 300);
  EXPECT_EQ(json["maliciousNodes"], 3);
  EXPECT_EQ(json["pendingTransactions"], 0);
}

TEST_F(NetworkTest, SaveWithoutMountFails) {
  Network network;
  auto saved = network.save();
  ASSERT_TRUE(saved.isError());
  EXPECT_EQ(saved.error().code, Network::E_STATE);
}
