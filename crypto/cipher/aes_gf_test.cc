// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include "crypto/cipher/aes_gf.h"

using crypto::cipher::Word;
namespace gf = crypto::cipher::gf;

TEST(GF, Add) {
  EXPECT_EQ(0x00, gf::add(0x00, 0x00));
  EXPECT_EQ(0xd4, gf::add(0x57, 0x83));
  EXPECT_EQ(0x00, gf::add(0xa5, 0xa5));

  Word a = {{0x01, 0x02, 0x03, 0x04}};
  Word b = {{0xff, 0x00, 0x03, 0x40}};
  Word expected = {{0xfe, 0x02, 0x00, 0x44}};
  EXPECT_EQ(expected, gf::add_word(a, b));
  EXPECT_EQ(a, gf::add_word(gf::add_word(a, b), b));
}

TEST(GF, Mult) {
  EXPECT_EQ(0x00, gf::mult(0x00, 0x00));
  EXPECT_EQ(0x00, gf::mult(0x01, 0x00));
  EXPECT_EQ(0x00, gf::mult(0x00, 0x01));
  EXPECT_EQ(0x01, gf::mult(0x53, 0xca));
  EXPECT_EQ(0x01, gf::mult(0xca, 0x53));

  // FIPS-197 section 4.2
  EXPECT_EQ(0xc1, gf::mult(0x57, 0x83));
  EXPECT_EQ(0xfe, gf::mult(0x57, 0x13));

  // FIPS-197 section 4.2.1, repeated xtime()
  EXPECT_EQ(0xae, gf::mult(0x57, 0x02));
  EXPECT_EQ(0x47, gf::mult(0x57, 0x04));
  EXPECT_EQ(0x8e, gf::mult(0x57, 0x08));
  EXPECT_EQ(0x07, gf::mult(0x57, 0x10));
}

TEST(GF, FieldLaws) {
  for (int a = 0; a < 256; ++a) {
    EXPECT_EQ(a, gf::mult(a, 0x01)) << "a=" << a;
    EXPECT_EQ(0, gf::mult(a, 0x00)) << "a=" << a;
    for (int b = 0; b < 256; b += 7) {
      EXPECT_EQ(gf::mult(a, b), gf::mult(b, a)) << "a=" << a << " b=" << b;
    }
  }

  // Every nonzero element has exactly one multiplicative inverse.
  for (int a = 1; a < 256; ++a) {
    unsigned count = 0;
    for (int b = 1; b < 256; ++b) {
      if (gf::mult(a, b) == 0x01) ++count;
    }
    EXPECT_EQ(1U, count) << "a=" << a;
  }
}
