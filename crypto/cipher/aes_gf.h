// crypto/cipher/aes_gf.h - Arithmetic over the Rijndael field GF(2^8)
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_AES_GF_H
#define CRYPTO_CIPHER_AES_GF_H

#include <array>
#include <cstdint>

namespace crypto {
namespace cipher {

// A Word is four bytes: one column of the AES State, or one column of a
// round key.
using Word = std::array<uint8_t, 4>;

namespace gf {

// The low byte of the reduction polynomial x^8 + x^4 + x^3 + x + 1 (0x11b).
constexpr uint8_t REDUCTION = 0x1b;

// Addition in GF(2^8) is XOR.  Every element is its own additive inverse.
constexpr uint8_t add(uint8_t a, uint8_t b) noexcept {
  return static_cast<uint8_t>(a ^ b);
}

// Adds two Words component by component.
Word add_word(const Word& a, const Word& b) noexcept;

// Multiplies two elements of GF(2^8), reducing modulo 0x11b.
//
// Shift-and-add ("Russian peasant") multiplication: no lookup tables.
// Total for all 65536 input pairs.
//
uint8_t mult(uint8_t a, uint8_t b) noexcept;

}  // namespace gf
}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_AES_GF_H
