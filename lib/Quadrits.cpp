#include "Quadrits.h"

namespace hx {
namespace quadrit {

namespace {

constexpr char SYMBOLS[4] = { 'A', 'T', 'C', 'G' };

int symbolValue(char c) {
  switch (c) {
  case 'A':
    return 0;
  case 'T':
    return 1;
  case 'C':
    return 2;
  case 'G':
    return 3;
  default:
    return -1;
  }
}

} // namespace

std::string encode(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size() * SYMBOLS_PER_BYTE);
  for (unsigned char byte : bytes) {
    for (int shift = 6; shift >= 0; shift -= 2) {
      out.push_back(SYMBOLS[(byte >> shift) & 0x3]);
    }
  }
  return out;
}

Roe<std::string> decode(const std::string &quadrits) {
  if (quadrits.size() % SYMBOLS_PER_BYTE != 0) {
    return Error(1, "Quadrit sequence length " +
                        std::to_string(quadrits.size()) +
                        " is not a multiple of 4");
  }

  std::string out;
  out.reserve(quadrits.size() / SYMBOLS_PER_BYTE);
  for (size_t i = 0; i < quadrits.size(); i += SYMBOLS_PER_BYTE) {
    int byte = 0;
    for (size_t j = 0; j < SYMBOLS_PER_BYTE; ++j) {
      int v = symbolValue(quadrits[i + j]);
      if (v < 0) {
        return Error(2, "Invalid quadrit symbol at position " +
                            std::to_string(i + j));
      }
      byte = (byte << 2) | v;
    }
    out.push_back(static_cast<char>(byte));
  }
  return out;
}

Roe<std::string> decodePadded(const std::string &quadrits) {
  size_t remainder = quadrits.size() % SYMBOLS_PER_BYTE;
  if (remainder == 0) {
    return decode(quadrits);
  }
  return decode(quadrits + std::string(SYMBOLS_PER_BYTE - remainder, 'A'));
}

bool isValid(const std::string &quadrits) {
  return decode(quadrits).isOk();
}

} // namespace quadrit
} // namespace hx
