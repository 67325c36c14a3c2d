#ifndef HX_LEDGER_HASH_CHAIN_H
#define HX_LEDGER_HASH_CHAIN_H

#include "BinaryPack.hpp"

#include <string>

namespace hx {

/**
 * Content addressing for structured records.
 *
 * A record's identity is the SHA-256 of its canonical archive encoding
 * (see OutputArchive), rendered as 64 lowercase hex characters. Equal
 * logical content always yields the same digest. Nothing is cached.
 */
namespace hashchain {

// Previous-hash sentinel of the genesis block
extern const std::string ZERO_HASH;

std::string digestBytes(const std::string &bytes);

template <typename T> std::string digest(const T &record) {
  return digestBytes(utl::binaryPack(record));
}

/**
 * Hash of two digests in order; used to bind a proposal to its anchors.
 */
std::string combine(const std::string &left, const std::string &right);

} // namespace hashchain
} // namespace hx

#endif // HX_LEDGER_HASH_CHAIN_H
