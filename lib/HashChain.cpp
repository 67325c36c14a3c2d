#include "HashChain.h"
#include "Utilities.h"

#include <utility>

namespace hx {
namespace hashchain {

const std::string ZERO_HASH(64, '0');

std::string digestBytes(const std::string &bytes) { return utl::sha256(bytes); }

std::string combine(const std::string &left, const std::string &right) {
  return digest(std::make_pair(left, right));
}

} // namespace hashchain
} // namespace hx
