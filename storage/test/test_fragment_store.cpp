#include "../FragmentStore.h"
#include "Logger.h"
#include <gtest/gtest.h>

#include <set>
#include <vector>

using namespace hx;

class FragmentStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const auto &nodeId : nodes_) {
      store_.addCustodian(nodeId);
    }
    payload_ = std::string("ledger block bytes\0\x01\x02\xff", 22);
    for (int i = 0; i < 100; ++i) {
      payload_ += static_cast<char>(i * 7);
    }
  }

  FragmentStore::Fragment fragment(const std::string &id = "block-1") const {
    return FragmentStore::Fragment::create(id, payload_, 3);
  }

  std::vector<std::string> nodes_{ "node-0", "node-1", "node-2", "node-3" };
  std::string payload_;
  FragmentStore store_;
};

TEST_F(FragmentStoreTest, MemberIds) {
  EXPECT_EQ(FragmentStore::memberId("block-1", 0), "block-1");
  EXPECT_EQ(FragmentStore::memberId("block-1", 2), "block-1#r2");

  std::string base;
  uint32_t index = 99;
  ASSERT_TRUE(FragmentStore::parseMemberId("block-1#r2", base, index));
  EXPECT_EQ(base, "block-1");
  EXPECT_EQ(index, 2u);
  ASSERT_TRUE(FragmentStore::parseMemberId("block-1", base, index));
  EXPECT_EQ(index, 0u);
  EXPECT_FALSE(FragmentStore::parseMemberId("block-1#r0", base, index));
  EXPECT_FALSE(FragmentStore::parseMemberId("block-1#rx", base, index));
  EXPECT_FALSE(FragmentStore::parseMemberId("#r1", base, index));
}

TEST_F(FragmentStoreTest, MasksDifferPerSibling) {
  EXPECT_EQ(FragmentStore::mask("block-1", 0, 8), std::string(8, '\0'));
  std::string first = FragmentStore::mask("block-1", 1, 100);
  EXPECT_EQ(first.size(), 100u);
  EXPECT_EQ(first, FragmentStore::mask("block-1", 1, 100));
  EXPECT_NE(first, FragmentStore::mask("block-1", 2, 100));
  EXPECT_NE(first, FragmentStore::mask("block-2", 1, 100));
  // Keystream prefix is stable across sizes
  EXPECT_EQ(FragmentStore::mask("block-1", 1, 10), first.substr(0, 10));
}

TEST_F(FragmentStoreTest, DistributePlacesOneMemberPerTarget) {
  ASSERT_TRUE(store_.distribute(fragment(), nodes_).isOk());

  auto group = store_.getGroup("block-1");
  ASSERT_TRUE(group.isOk());
  ASSERT_EQ(group->members.size(), 4u);
  for (size_t i = 0; i < nodes_.size(); ++i) {
    auto where = store_.getLocations(group->members[i]);
    ASSERT_EQ(where.size(), 1u);
    EXPECT_EQ(*where.begin(), nodes_[i]);
  }

  // Primary is the payload, siblings are masked
  auto primary = store_.getHoldings("node-0");
  EXPECT_EQ(primary.at("block-1"), payload_);
  auto sibling = store_.getHoldings("node-1");
  EXPECT_NE(sibling.at("block-1#r1"), payload_);
  EXPECT_EQ(sibling.at("block-1#r1").size(), payload_.size());

  auto retrieved = store_.retrieve("block-1");
  ASSERT_TRUE(retrieved.isOk());
  EXPECT_EQ(*retrieved, payload_);
}

TEST_F(FragmentStoreTest, MemberCountBoundedByRedundancy) {
  store_.addCustodian("node-4");
  std::vector<std::string> targets = nodes_;
  targets.push_back("node-4");
  ASSERT_TRUE(store_.distribute(fragment(), targets).isOk());
  EXPECT_EQ(store_.getGroup("block-1")->members.size(), 4u);
  EXPECT_TRUE(store_.getHoldings("node-4").empty());

  ASSERT_TRUE(store_.distribute(fragment("block-2"), { "node-0", "node-1" }).isOk());
  EXPECT_EQ(store_.getGroup("block-2")->members.size(), 2u);
}

TEST_F(FragmentStoreTest, DistributeValidation) {
  auto tooFew = store_.distribute(fragment(), { "node-0" });
  ASSERT_TRUE(tooFew.isError());
  EXPECT_EQ(tooFew.error().code, FragmentStore::E_TOO_FEW_TARGETS);

  auto tampered = fragment();
  tampered.payload += "x";
  EXPECT_EQ(store_.distribute(tampered, nodes_).error().code,
            FragmentStore::E_INVALID_FRAGMENT);

  EXPECT_EQ(store_.distribute(fragment(), { "node-0", "node-0" }).error().code,
            FragmentStore::E_INVALID_TARGETS);
  EXPECT_EQ(store_.distribute(fragment(), { "node-0", "stranger" }).error().code,
            FragmentStore::E_NO_CUSTODIAN);
  EXPECT_EQ(store_.distribute(fragment("bad#r1"), nodes_).error().code,
            FragmentStore::E_INVALID_FRAGMENT);
  EXPECT_FALSE(store_.hasFragment("block-1"));
}

TEST_F(FragmentStoreTest, RedistributeIsIdempotent) {
  ASSERT_TRUE(store_.distribute(fragment(), nodes_).isOk());
  EXPECT_TRUE(store_.distribute(fragment(), nodes_).isOk());
  EXPECT_EQ(store_.getFragmentIds().size(), 1u);

  auto conflicting = FragmentStore::Fragment::create("block-1", "other", 3);
  EXPECT_EQ(store_.distribute(conflicting, nodes_).error().code,
            FragmentStore::E_CONFLICT);
}

TEST_F(FragmentStoreTest, AnyTwoFailuresRecoverByteExact) {
  for (size_t a = 0; a < nodes_.size(); ++a) {
    for (size_t b = a + 1; b < nodes_.size(); ++b) {
      FragmentStore store;
      for (const auto &nodeId : nodes_) {
        store.addCustodian(nodeId);
      }
      ASSERT_TRUE(store.distribute(fragment(), nodes_).isOk());

      auto report = store.onNodeFailure({ nodes_[a], nodes_[b] });
      EXPECT_EQ(report.lostMembers.size(), 2u);
      EXPECT_EQ(report.regenerated.size(), 2u);
      EXPECT_TRUE(report.irrecoverable.empty());
      EXPECT_TRUE(report.unplaced.empty());
      for (const auto &placement : report.regenerated) {
        EXPECT_NE(placement.nodeId, nodes_[a]);
        EXPECT_NE(placement.nodeId, nodes_[b]);
      }
      EXPECT_EQ(store.getRegenerationCount(), 2u);

      auto retrieved = store.retrieve("block-1");
      ASSERT_TRUE(retrieved.isOk()) << nodes_[a] << "," << nodes_[b];
      EXPECT_EQ(*retrieved, payload_);

      // Every member is stored again, and decodes on its own
      auto group = store.getGroup("block-1");
      ASSERT_TRUE(group.isOk());
      for (const auto &member : group->members) {
        EXPECT_FALSE(store.getLocations(member).empty()) << member;
      }
    }
  }
}

TEST_F(FragmentStoreTest, RegenerationPrefersFreshCustodian) {
  store_.addCustodian("node-4");
  ASSERT_TRUE(store_.distribute(fragment(), nodes_).isOk());

  auto report = store_.onNodeFailure({ "node-2" });
  ASSERT_EQ(report.regenerated.size(), 1u);
  EXPECT_EQ(report.regenerated[0].memberId, "block-1#r2");
  EXPECT_EQ(report.regenerated[0].nodeId, "node-4");
  EXPECT_EQ(store_.getHoldings("node-4").count("block-1#r2"), 1u);
  EXPECT_FALSE(store_.isCustodian("node-2"));
}

TEST_F(FragmentStoreTest, RegenerateIsIdempotent) {
  ASSERT_TRUE(store_.distribute(fragment(), nodes_).isOk());
  auto first = store_.regenerate("block-1#r1");
  ASSERT_TRUE(first.isOk());
  EXPECT_EQ(first->nodeId, "node-1");
  auto second = store_.regenerate("block-1#r1");
  ASSERT_TRUE(second.isOk());
  EXPECT_TRUE(*first == *second);
  EXPECT_EQ(store_.getRegenerationCount(), 0u);

  EXPECT_EQ(store_.regenerate("block-1#r9").error().code,
            FragmentStore::E_UNKNOWN_FRAGMENT);
  EXPECT_EQ(store_.regenerate("missing").error().code,
            FragmentStore::E_UNKNOWN_FRAGMENT);
}

TEST_F(FragmentStoreTest, TotalFailureIsIrrecoverable) {
  auto memory = std::make_shared<logging::MemoryHandler>();
  memory->setLevel(logging::Level::CRITICAL);
  logging::getLogger("storage.fragments").addHandler(memory);

  ASSERT_TRUE(store_.distribute(fragment(), nodes_).isOk());
  auto report = store_.onNodeFailure(nodes_);

  EXPECT_EQ(report.lostMembers.size(), 4u);
  EXPECT_TRUE(report.regenerated.empty());
  ASSERT_EQ(report.irrecoverable.size(), 1u);
  EXPECT_EQ(report.irrecoverable[0], "block-1");
  EXPECT_EQ(store_.getIrrecoverableCount(), 1u);
  EXPECT_TRUE(store_.getGroup("block-1")->lost);

  auto retrieved = store_.retrieve("block-1");
  ASSERT_TRUE(retrieved.isError());
  EXPECT_EQ(retrieved.error().code, FragmentStore::E_IRRECOVERABLE);
  auto regenerated = store_.regenerate("block-1");
  ASSERT_TRUE(regenerated.isError());
  EXPECT_EQ(regenerated.error().code, FragmentStore::E_IRRECOVERABLE);

  // Counted once per fragment
  EXPECT_EQ(store_.getIrrecoverableCount(), 1u);
  EXPECT_GE(memory->count(logging::Level::CRITICAL), 1u);
  logging::getLogger("storage.fragments").clearHandlers();
}

TEST_F(FragmentStoreTest, LastCustodianTakesRegeneratedSibling) {
  ASSERT_TRUE(store_.distribute(fragment(), { "node-0", "node-1" }).isOk());
  auto report = store_.onNodeFailure({ "node-1", "node-2", "node-3" });
  ASSERT_EQ(report.lostMembers.size(), 1u);
  ASSERT_EQ(report.regenerated.size(), 1u);
  EXPECT_EQ(report.regenerated[0].nodeId, "node-0");
  EXPECT_TRUE(report.unplaced.empty());

  auto second = store_.onNodeFailure({ "node-0" });
  EXPECT_EQ(second.irrecoverable.size(), 1u);
}

TEST_F(FragmentStoreTest, ExportRestore) {
  ASSERT_TRUE(store_.distribute(fragment(), nodes_).isOk());
  store_.onNodeFailure({ "node-1" });

  FragmentStore restored;
  restored.restore(store_.exportState());
  EXPECT_EQ(restored.getCustodians(), store_.getCustodians());
  EXPECT_EQ(restored.getRegenerationCount(), 1u);
  EXPECT_EQ(restored.getLocations("block-1#r1"), store_.getLocations("block-1#r1"));
  auto retrieved = restored.retrieve("block-1");
  ASSERT_TRUE(retrieved.isOk());
  EXPECT_EQ(*retrieved, payload_);
}
