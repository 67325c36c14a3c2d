#include "../ReputationLedger.h"
#include <gtest/gtest.h>

#include <limits>
#include <thread>
#include <vector>

using namespace hx;
using namespace hx::consensus;

class ReputationLedgerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(registry_.registerOfficialVersion("1.0.0").isOk());
    ASSERT_TRUE(reputation_.registerNode("node-0", 1000, 1.0).isOk());
    ASSERT_TRUE(reputation_.registerNode("node-1", 50, 0.8).isOk());
    ASSERT_TRUE(reputation_.registerNode("broke", 0, 0.3).isOk());
  }

  static Node node(const std::string &id) {
    Node n;
    n.id = id;
    n.version = "1.0.0";
    n.softwareHash = SoftwareRegistry::softwareHashFor("1.0.0");
    n.canAttest = true;
    return n;
  }

  Ledger ledger_;
  SoftwareRegistry registry_;
  ReputationLedger reputation_{ ledger_, registry_ };
};

TEST_F(ReputationLedgerTest, RegisterValidates) {
  EXPECT_EQ(reputation_.registerNode("node-0", 10, 1.0).error().code,
            ReputationLedger::E_DUPLICATE_NODE);
  EXPECT_EQ(reputation_.registerNode("neg", -1, 1.0).error().code,
            ReputationLedger::E_INVALID_AMOUNT);
  ASSERT_TRUE(reputation_.registerNode("high", 1, 7.0).isOk());
  EXPECT_DOUBLE_EQ(reputation_.getReputation("high"), 1.0);
}

TEST_F(ReputationLedgerTest, SlashMovesStakeToTreasury) {
  auto record = reputation_.slash("node-0", ReputationLedger::SlashReason::WRONG_CLAIM, 4);
  ASSERT_TRUE(record.isOk());
  EXPECT_EQ(record->slashedAmount, 100);
  EXPECT_EQ(record->stakeAfter, 900);
  EXPECT_DOUBLE_EQ(record->reputationBefore, 1.0);
  EXPECT_DOUBLE_EQ(record->reputationAfter, 0.5);
  EXPECT_EQ(record->round, 4u);

  EXPECT_EQ(reputation_.getStake("node-0"), 900);
  EXPECT_EQ(ledger_.getBalance("treasury"), 100);
  EXPECT_EQ(reputation_.getSlashEventCount(), 1u);
  EXPECT_EQ(reputation_.getMaliciousNodes().count("node-0"), 1u);
}

TEST_F(ReputationLedgerTest, SlashTakesAtMostTheStake) {
  auto record = reputation_.slash("node-1", ReputationLedger::SlashReason::OMISSION, 0);
  ASSERT_TRUE(record.isOk());
  EXPECT_EQ(record->slashedAmount, 50);
  EXPECT_EQ(reputation_.getStake("node-1"), 0);
  EXPECT_EQ(ledger_.getBalance("treasury"), 50);
  EXPECT_TRUE(reputation_.getMaliciousNodes().empty());
}

TEST_F(ReputationLedgerTest, ZeroStakeStillLosesReputation) {
  auto record = reputation_.slash("broke", ReputationLedger::SlashReason::TIMEOUT, 0);
  ASSERT_TRUE(record.isOk());
  EXPECT_EQ(record->slashedAmount, 0);
  EXPECT_DOUBLE_EQ(reputation_.getReputation("broke"), 0.0);
}

TEST_F(ReputationLedgerTest, SlashUnknownNodeFails) {
  auto record = reputation_.slash("ghost", ReputationLedger::SlashReason::OMISSION, 0);
  ASSERT_TRUE(record.isError());
  EXPECT_EQ(record.error().code, ReputationLedger::E_UNKNOWN_NODE);
  EXPECT_EQ(reputation_.getSlashEventCount(), 0u);
}

TEST_F(ReputationLedgerTest, FailedTreasuryCreditChangesNothing) {
  ASSERT_TRUE(ledger_.credit("treasury", std::numeric_limits<int64_t>::max()).isOk());
  auto record = reputation_.slash("node-0", ReputationLedger::SlashReason::WRONG_CLAIM, 0);
  ASSERT_TRUE(record.isError());
  EXPECT_EQ(record.error().code, ReputationLedger::E_CREDIT_FAILED);
  EXPECT_EQ(reputation_.getStake("node-0"), 1000);
  EXPECT_DOUBLE_EQ(reputation_.getReputation("node-0"), 1.0);
  EXPECT_EQ(reputation_.getSlashEventCount(), 0u);
}

TEST_F(ReputationLedgerTest, ConcurrentSlashesAreAtomic) {
  ReputationLedger::Config config;
  config.slashPenalty = 1;
  config.slashReputationDecrement = 0.001;
  reputation_.setConfig(config);

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([this]() {
      for (int i = 0; i < 100; ++i) {
        auto record = reputation_.slash(
            "node-0", ReputationLedger::SlashReason::OMISSION, 0);
        EXPECT_TRUE(record.isOk());
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(reputation_.getStake("node-0"), 200);
  EXPECT_EQ(ledger_.getBalance("treasury"), 800);
  EXPECT_EQ(reputation_.getSlashEventCount(), 800u);
  EXPECT_NEAR(reputation_.getReputation("node-0"), 0.2, 1e-9);
  // Stake plus treasury is conserved
  EXPECT_EQ(reputation_.getStake("node-0") + ledger_.getBalance("treasury"), 1000);
}

TEST_F(ReputationLedgerTest, RewardCreditsAndClamps) {
  ASSERT_TRUE(reputation_.reward("node-1", 25, 0.5).isOk());
  EXPECT_EQ(ledger_.getBalance("node-1"), 25);
  EXPECT_DOUBLE_EQ(reputation_.getReputation("node-1"), 1.0);
  EXPECT_EQ(reputation_.getStake("node-1"), 50);

  EXPECT_EQ(reputation_.reward("node-1", -1, 0).error().code,
            ReputationLedger::E_INVALID_AMOUNT);
  EXPECT_EQ(reputation_.reward("ghost", 1, 0).error().code,
            ReputationLedger::E_UNKNOWN_NODE);
}

TEST_F(ReputationLedgerTest, EligibilityNeedsReputationAndCompliance) {
  EXPECT_TRUE(reputation_.eligible(node("node-0"), 0.5));
  EXPECT_FALSE(reputation_.eligible(node("broke"), 0.5));
  EXPECT_FALSE(reputation_.eligible(node("ghost"), 0.0));

  Node tampered = node("node-0");
  tampered.softwareHash = SoftwareRegistry::softwareHashFor("evil");
  EXPECT_FALSE(reputation_.eligible(tampered, 0.5));

  // Reputation exactly at the floor is eligible
  EXPECT_TRUE(reputation_.eligible(node("node-1"), 0.8));
}

TEST_F(ReputationLedgerTest, NoRecoveryWithoutRehabilitation) {
  ASSERT_TRUE(reputation_.slash("node-0", ReputationLedger::SlashReason::WRONG_CLAIM, 0).isOk());
  ASSERT_TRUE(reputation_.slash("node-0", ReputationLedger::SlashReason::WRONG_CLAIM, 1).isOk());
  EXPECT_DOUBLE_EQ(reputation_.getReputation("node-0"), 0.0);
  EXPECT_FALSE(reputation_.eligible(node("node-0"), 0.5));

  ASSERT_TRUE(reputation_.rehabilitate("node-0", 0.6).isOk());
  EXPECT_TRUE(reputation_.eligible(node("node-0"), 0.5));
  EXPECT_EQ(reputation_.rehabilitate("ghost", 1.0).error().code,
            ReputationLedger::E_UNKNOWN_NODE);
}

TEST_F(ReputationLedgerTest, MeanReputationAndRestore) {
  EXPECT_NEAR(reputation_.getMeanReputation(), (1.0 + 0.8 + 0.3) / 3, 1e-9);
  ASSERT_TRUE(reputation_.slash("node-0", ReputationLedger::SlashReason::WRONG_CLAIM, 0).isOk());

  Ledger otherLedger;
  ReputationLedger restored(otherLedger, registry_);
  restored.restore(reputation_.getEntries(), reputation_.getSlashHistory());
  EXPECT_EQ(restored.getStake("node-0"), 900);
  EXPECT_DOUBLE_EQ(restored.getReputation("node-1"), 0.8);
  EXPECT_EQ(restored.getSlashEventCount(), 1u);
  EXPECT_EQ(restored.getMaliciousNodes(), reputation_.getMaliciousNodes());
}
