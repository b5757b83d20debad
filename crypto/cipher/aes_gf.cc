// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/cipher/aes_gf.h"

namespace crypto {
namespace cipher {
namespace gf {

Word add_word(const Word& a, const Word& b) noexcept {
  Word out;
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = add(a[i], b[i]);
  }
  return out;
}

uint8_t mult(uint8_t a, uint8_t b) noexcept {
  uint8_t p = 0;
  while (a != 0 && b != 0) {
    if (b & 0x01) p ^= a;
    b >>= 1;
    if (a & 0x80)
      a = static_cast<uint8_t>(a << 1) ^ REDUCTION;
    else
      a = static_cast<uint8_t>(a << 1);
  }
  return p;
}

}  // namespace gf
}  // namespace cipher
}  // namespace crypto
