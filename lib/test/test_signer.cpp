#include "../Signer.h"
#include <gtest/gtest.h>

using namespace hx;

TEST(SignerTest, DerivedKeysSignAndVerify) {
  Ed25519Signer signer;
  auto keys = signer.deriveKeyPair("seed:node-0");
  ASSERT_TRUE(keys.isOk());
  auto again = signer.deriveKeyPair("seed:node-0");
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(keys->publicKey, again->publicKey);

  auto signature = signer.sign("proof", keys->privateKey);
  ASSERT_TRUE(signature.isOk());
  EXPECT_TRUE(signer.verify("proof", *signature, keys->publicKey));
  EXPECT_FALSE(signer.verify("forged", *signature, keys->publicKey));

  auto stranger = signer.deriveKeyPair("seed:node-1");
  ASSERT_TRUE(stranger.isOk());
  EXPECT_FALSE(signer.verify("proof", *signature, stranger->publicKey));
}

TEST(SignerTest, SignRejectsMalformedKey) {
  Ed25519Signer signer;
  EXPECT_TRUE(signer.sign("proof", "short").isError());
  EXPECT_FALSE(signer.verify("proof", "", ""));
}
