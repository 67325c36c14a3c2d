#ifndef HX_LEDGER_UTILITIES_H
#define HX_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hx {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 */
int64_t getCurrentTime();

/**
 * Parse a 64-bit signed integer from a string
 * @return true if the whole string parsed
 */
bool parseInt64(const std::string &str, int64_t &value);

std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter);

/**
 * Load and parse a JSON file
 * @param configPath Path to the JSON file
 * @return Parsed JSON or error (1 missing, 2 unreadable, 3 parse error)
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Read a whole file as bytes
 */
Roe<std::string> readFile(const std::string &filePath);

/**
 * Write a file through a temporary sibling and rename it into place.
 * Creates parent directories if needed; overwrites an existing file.
 */
Roe<void> writeFile(const std::string &filePath, const std::string &content);

/**
 * SHA-256 via OpenSSL EVP
 * @return Lowercase hex string, 64 characters
 * @throws std::runtime_error if the digest context cannot be used
 */
std::string sha256(const std::string &input);

/**
 * HMAC-SHA256 via OpenSSL
 * @return Raw 32-byte MAC
 * @throws std::runtime_error on library failure
 */
std::string hmacSha256(const std::string &key, const std::string &message);

/**
 * @return true if s is a 64-character lowercase hex string
 */
bool isHash256(const std::string &s);

/**
 * Encode binary data as lowercase hex (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

// --- Ed25519 via libsodium (32-byte public key, 32-byte private seed,
// 64-byte signature)

struct Ed25519KeyPair {
  std::string publicKey;
  std::string privateKey;
};

/**
 * Generate a random key pair
 */
Roe<Ed25519KeyPair> ed25519Generate();

/**
 * Derive a key pair deterministically from an arbitrary seed string.
 * The seed is hashed to 32 bytes first.
 */
Roe<Ed25519KeyPair> ed25519FromSeed(const std::string &seed);

Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message);

/**
 * @return true if signature is valid; false for a bad signature or any
 * malformed key/signature size
 */
bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature);

} // namespace utl
} // namespace hx

#endif // HX_LEDGER_UTILITIES_H
