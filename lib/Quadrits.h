#ifndef HX_LEDGER_QUADRITS_H
#define HX_LEDGER_QUADRITS_H

#include "Utilities.h"

#include <string>

namespace hx {

/**
 * Quadrit text encoding of byte strings.
 *
 * Each byte becomes four symbols, two bits each, most significant pair
 * first: A=00 T=01 C=10 G=11. An empty input encodes to an empty string.
 */
namespace quadrit {

constexpr size_t SYMBOLS_PER_BYTE = 4;

std::string encode(const std::string &bytes);

/**
 * Strict decode. Fails if the length is not a multiple of four or a symbol
 * other than A/T/C/G appears.
 */
Roe<std::string> decode(const std::string &quadrits);

/**
 * Lenient decode for sequences cut mid-byte: a trailing partial group is
 * right-padded with 'A' (zero bits) before decoding, so "T" reads as
 * "TAAA" = 0x40. Invalid symbols still fail.
 */
Roe<std::string> decodePadded(const std::string &quadrits);

bool isValid(const std::string &quadrits);

} // namespace quadrit
} // namespace hx

#endif // HX_LEDGER_QUADRITS_H
