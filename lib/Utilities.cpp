#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace hx {
namespace utl {

namespace {

constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

// libsodium must be initialized once before any signing call
void ensureSodium() {
  static const bool initialized = []() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    return true;
  }();
  (void)initialized;
}

Roe<Ed25519KeyPair> keyPairFromSeedBytes(const unsigned char *seed) {
  ensureSodium();
  Ed25519KeyPair pair;
  pair.publicKey.resize(crypto_sign_PUBLICKEYBYTES);
  std::string secretKey(crypto_sign_SECRETKEYBYTES, '\0');
  if (crypto_sign_seed_keypair(
          reinterpret_cast<unsigned char *>(pair.publicKey.data()),
          reinterpret_cast<unsigned char *>(secretKey.data()), seed) != 0) {
    return Error(1, "crypto_sign_seed_keypair failed");
  }
  // Keep only the 32-byte seed; the expanded key is rebuilt when signing
  pair.privateKey.assign(reinterpret_cast<const char *>(seed),
                         ED25519_PRIVATE_KEY_SIZE);
  return pair;
}

} // namespace

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool parseInt64(const std::string &str, int64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < strings.size(); ++i) {
    if (i > 0) {
      result += delimiter;
    }
    result += strings[i];
  }
  return result;
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }
  return config;
}

Roe<std::string> readFile(const std::string &filePath) {
  std::ifstream file(filePath, std::ios::binary);
  if (!file.is_open()) {
    return Error(1, "Failed to open file: " + filePath);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(2, "Failed to read file: " + filePath);
  }
  return content;
}

Roe<void> writeFile(const std::string &filePath, const std::string &content) {
  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(1, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::string tmpPath = filePath + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Error(2, "Failed to open file for writing: " + tmpPath);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file.good()) {
      return Error(3, "Failed to write content to file: " + tmpPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmpPath, filePath, ec);
  if (ec) {
    return Error(4, "Failed to move " + tmpPath + " into place: " +
                        ec.message());
  }
  return {};
}

std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;
  bool ok = EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(mdctx, input.data(), input.size()) == 1 &&
            EVP_DigestFinal_ex(mdctx, hash, &hashLen) == 1;
  EVP_MD_CTX_free(mdctx);
  if (!ok) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash), hashLen));
}

std::string hmacSha256(const std::string &key, const std::string &message) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int macLen = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(message.data()),
           message.size(), mac, &macLen) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<const char *>(mac), macLen);
}

bool isHash256(const std::string &s) {
  if (s.size() != 64) {
    return false;
  }
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

// --- Ed25519

Roe<Ed25519KeyPair> ed25519Generate() {
  ensureSodium();
  unsigned char seed[ED25519_PRIVATE_KEY_SIZE];
  randombytes_buf(seed, sizeof(seed));
  auto result = keyPairFromSeedBytes(seed);
  sodium_memzero(seed, sizeof(seed));
  return result;
}

Roe<Ed25519KeyPair> ed25519FromSeed(const std::string &seed) {
  std::string digest = hexDecode(sha256(seed));
  return keyPairFromSeedBytes(
      reinterpret_cast<const unsigned char *>(digest.data()));
}

Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message) {
  if (privateKey.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Error(1, "ed25519Sign: private key must be 32 bytes");
  }
  ensureSodium();

  std::string pk(crypto_sign_PUBLICKEYBYTES, '\0');
  std::string sk(crypto_sign_SECRETKEYBYTES, '\0');
  if (crypto_sign_seed_keypair(
          reinterpret_cast<unsigned char *>(pk.data()),
          reinterpret_cast<unsigned char *>(sk.data()),
          reinterpret_cast<const unsigned char *>(privateKey.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }

  std::string signature(crypto_sign_BYTES, '\0');
  unsigned long long sigLen = 0;
  int rc = crypto_sign_detached(
      reinterpret_cast<unsigned char *>(signature.data()), &sigLen,
      reinterpret_cast<const unsigned char *>(message.data()), message.size(),
      reinterpret_cast<const unsigned char *>(sk.data()));
  sodium_memzero(sk.data(), sk.size());
  if (rc != 0) {
    return Error(3, "crypto_sign_detached failed");
  }
  if (sigLen != ED25519_SIGNATURE_SIZE) {
    return Error(4, "unexpected signature size");
  }
  return signature;
}

bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature) {
  if (publicKey.size() != ED25519_PUBLIC_KEY_SIZE ||
      signature.size() != ED25519_SIGNATURE_SIZE) {
    return false;
  }
  ensureSodium();
  return crypto_sign_verify_detached(
             reinterpret_cast<const unsigned char *>(signature.data()),
             reinterpret_cast<const unsigned char *>(message.data()),
             message.size(),
             reinterpret_cast<const unsigned char *>(publicKey.data())) == 0;
}

} // namespace utl
} // namespace hx
