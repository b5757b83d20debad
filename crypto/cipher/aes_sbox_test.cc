// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <set>

#include "crypto/cipher/aes_gf.h"
#include "crypto/cipher/aes_sbox.h"

using crypto::cipher::SBOX_0;
using crypto::cipher::SBOX_1;

TEST(SBox, KnownValues) {
  EXPECT_EQ(0x63, SBOX_0[0x00]);
  EXPECT_EQ(0x7c, SBOX_0[0x01]);
  EXPECT_EQ(0xed, SBOX_0[0x53]);
  EXPECT_EQ(0x16, SBOX_0[0xff]);

  EXPECT_EQ(0x52, SBOX_1[0x00]);
  EXPECT_EQ(0x53, SBOX_1[0xed]);
  EXPECT_EQ(0x7d, SBOX_1[0xff]);
}

TEST(SBox, Permutation) {
  std::set<uint8_t> fwd, inv;
  for (int x = 0; x < 256; ++x) {
    fwd.insert(SBOX_0[x]);
    inv.insert(SBOX_1[x]);
    EXPECT_EQ(x, SBOX_0[SBOX_1[x]]) << "x=" << x;
    EXPECT_EQ(x, SBOX_1[SBOX_0[x]]) << "x=" << x;
  }
  EXPECT_EQ(256U, fwd.size());
  EXPECT_EQ(256U, inv.size());
}

// S(x) is the affine transform of the multiplicative inverse of x.
TEST(SBox, AffineOfInverse) {
  namespace gf = crypto::cipher::gf;
  for (int x = 0; x < 256; ++x) {
    uint8_t b = 0;
    for (int y = 1; y < 256 && x != 0; ++y) {
      if (gf::mult(x, y) == 0x01) {
        b = y;
        break;
      }
    }
    uint8_t s = b;
    for (int i = 1; i <= 4; ++i) {
      s ^= static_cast<uint8_t>((b << i) | (b >> (8 - i)));
    }
    s ^= 0x63;
    EXPECT_EQ(s, SBOX_0[x]) << "x=" << x;
  }
}
