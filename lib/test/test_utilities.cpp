#include "../Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace hx {
namespace utl {

TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsLowercaseHex64) {
  std::string hash = sha256("test");
  EXPECT_TRUE(isHash256(hash));
  EXPECT_FALSE(isHash256(hash.substr(1)));
  EXPECT_FALSE(isHash256(std::string(64, 'A')));
}

TEST(HmacTest, Rfc4231Case2) {
  std::string mac = hmacSha256("Jefe", "what do ya want for nothing?");
  EXPECT_EQ(mac.size(), 32u);
  EXPECT_EQ(hexEncode(mac),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HexTest, EncodeDecode) {
  std::string bytes("\x00\x7f\xff", 3);
  EXPECT_EQ(hexEncode(bytes), "007fff");
  EXPECT_EQ(hexDecode("007fff"), bytes);
  EXPECT_EQ(hexDecode("abc"), "");
  EXPECT_EQ(hexDecode("zz"), "");
}

TEST(ParseInt64Test, AcceptsOnlyWholeNumbers) {
  int64_t value = 0;
  EXPECT_TRUE(parseInt64("-42", value));
  EXPECT_EQ(value, -42);
  EXPECT_FALSE(parseInt64("12abc", value));
  EXPECT_FALSE(parseInt64("", value));
  EXPECT_FALSE(parseInt64("99999999999999999999", value));
}

TEST(JoinTest, JoinsWithDelimiter) {
  EXPECT_EQ(join({ "a", "b", "c" }, ", "), "a, b, c");
  EXPECT_EQ(join({}, ","), "");
}

TEST(FileTest, WriteThenReadCreatesParents) {
  auto dir = std::filesystem::temp_directory_path() / "hx_utilities_test";
  std::filesystem::remove_all(dir);
  auto path = (dir / "nested" / "file.bin").string();

  std::string content("binary\0content", 14);
  ASSERT_TRUE(writeFile(path, content).isOk());
  auto read = readFile(path);
  ASSERT_TRUE(read.isOk());
  EXPECT_EQ(*read, content);

  ASSERT_TRUE(writeFile(path, "replaced").isOk());
  EXPECT_EQ(readFile(path).value(), "replaced");
  std::filesystem::remove_all(dir);
}

TEST(JsonTest, LoadJsonFileReportsErrors) {
  auto dir = std::filesystem::temp_directory_path() / "hx_json_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto missing = loadJsonFile((dir / "missing.json").string());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 1);

  std::ofstream((dir / "bad.json").string()) << "{ not json";
  auto bad = loadJsonFile((dir / "bad.json").string());
  ASSERT_TRUE(bad.isError());
  EXPECT_EQ(bad.error().code, 3);

  std::ofstream((dir / "good.json").string()) << R"({"port": 8517})";
  auto good = loadJsonFile((dir / "good.json").string());
  ASSERT_TRUE(good.isOk());
  EXPECT_EQ((*good)["port"].get<int>(), 8517);
  std::filesystem::remove_all(dir);
}

TEST(Ed25519Test, GenerateReturnsValidKeyPair) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk()) << (pair.isError() ? pair.error().message : "");
  EXPECT_EQ(pair->publicKey.size(), 32u);
  EXPECT_EQ(pair->privateKey.size(), 32u);
}

TEST(Ed25519Test, SignAndVerify) {
  auto pair = ed25519Generate();
  ASSERT_TRUE(pair.isOk());
  auto signature = ed25519Sign(pair->privateKey, "message");
  ASSERT_TRUE(signature.isOk());
  EXPECT_EQ(signature->size(), 64u);
  EXPECT_TRUE(ed25519Verify(pair->publicKey, "message", *signature));
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "other message", *signature));
  EXPECT_FALSE(ed25519Verify(pair->publicKey, "message", "short"));
}

TEST(Ed25519Test, SeedDerivationIsDeterministic) {
  auto first = ed25519FromSeed("hx-ledger:node-1");
  auto second = ed25519FromSeed("hx-ledger:node-1");
  auto other = ed25519FromSeed("hx-ledger:node-2");
  ASSERT_TRUE(first.isOk() && second.isOk() && other.isOk());
  EXPECT_EQ(first->publicKey, second->publicKey);
  EXPECT_EQ(first->privateKey, second->privateKey);
  EXPECT_NE(first->publicKey, other->publicKey);
}

TEST(Ed25519Test, SignRejectsMalformedKey) {
  EXPECT_TRUE(ed25519Sign("too short", "message").isError());
}

} // namespace utl
} // namespace hx
