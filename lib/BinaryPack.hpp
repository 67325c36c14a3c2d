#ifndef HX_LEDGER_BINARY_PACK_HPP
#define HX_LEDGER_BINARY_PACK_HPP

#include "ResultOrError.hpp"
#include "Serialize.hpp"
#include <sstream>
#include <string>

namespace hx {
namespace utl {

struct BinaryUnpackError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

/**
 * Canonical binary encoding of an object through OutputArchive
 */
template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

/**
 * Decode an object written by binaryPack().
 * Fails on short input and on trailing bytes.
 */
template <typename T>
ResultOrError<T, BinaryUnpackError> binaryUnpack(const std::string &data) {
  std::istringstream iss(data);
  InputArchive ar(iss);
  T result{};
  ar &result;
  if (ar.failed()) {
    return BinaryUnpackError(1, "Failed to deserialize binary data");
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    return BinaryUnpackError(2, "Trailing bytes after binary data");
  }
  return result;
}

} // namespace utl
} // namespace hx

#endif // HX_LEDGER_BINARY_PACK_HPP
