#include "../HashChain.h"
#include "../Utilities.h"
#include <gtest/gtest.h>

using namespace hx;

namespace {

struct Pair {
  std::string left;
  uint32_t right{ 0 };

  template <typename Archive> void serialize(Archive &ar) { ar & left & right; }
};

} // namespace

TEST(HashChainTest, DigestIsDeterministic) {
  Pair first{ "a", 1 };
  Pair same{ "a", 1 };
  Pair other{ "a", 2 };
  EXPECT_EQ(hashchain::digest(first), hashchain::digest(same));
  EXPECT_NE(hashchain::digest(first), hashchain::digest(other));
  EXPECT_TRUE(utl::isHash256(hashchain::digest(first)));
}

TEST(HashChainTest, DigestBytesIsSha256) {
  EXPECT_EQ(hashchain::digestBytes(""), utl::sha256(""));
  EXPECT_EQ(hashchain::ZERO_HASH, std::string(64, '0'));
}

TEST(HashChainTest, CombineIsOrdered) {
  std::string a = hashchain::digestBytes("a");
  std::string b = hashchain::digestBytes("b");
  EXPECT_EQ(hashchain::combine(a, b), hashchain::combine(a, b));
  EXPECT_NE(hashchain::combine(a, b), hashchain::combine(b, a));
}
