// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <random>
#include <sstream>
#include <vector>

#include "base/result_testing.h"
#include "crypto/cipher/aes_state.h"

using crypto::cipher::RoundKey;
using crypto::cipher::State;
using crypto::cipher::Word;

using Rows = std::array<Word, 4>;

static State random_state(std::mt19937* rng) {
  State state;
  for (std::size_t r = 0; r < 4; ++r) {
    for (std::size_t c = 0; c < 4; ++c) {
      state.at(r, c) = static_cast<uint8_t>((*rng)() & 0xff);
    }
  }
  return state;
}

TEST(State, Layout) {
  std::vector<uint8_t> raw;
  for (uint8_t i = 0; i < 16; ++i) raw.push_back(i);

  State state;
  ASSERT_OK(State::from_bytes(&state, raw));
  EXPECT_EQ(0x04, state.at(0, 1));
  EXPECT_EQ(0x01, state.at(1, 0));
  EXPECT_EQ((Word{{0x08, 0x09, 0x0a, 0x0b}}), state.column(2));
  EXPECT_EQ((Word{{0x03, 0x07, 0x0b, 0x0f}}), state.row(3));

  state.set_row(0, Word{{0xf0, 0xf1, 0xf2, 0xf3}});
  EXPECT_EQ(0xf1, state.bytes()[4]);
  state.set_column(3, Word{{0xa0, 0xa1, 0xa2, 0xa3}});
  EXPECT_EQ(0xa2, state.at(2, 3));

  std::ostringstream o;
  o << State::from_rows(Rows{{
      {{0x00, 0x01, 0x02, 0x03}},
      {{0x10, 0x11, 0x12, 0x13}},
      {{0x20, 0x21, 0x22, 0x23}},
      {{0xa0, 0xb1, 0xc2, 0xd3}},
  }});
  EXPECT_EQ("00 01 02 03 / 10 11 12 13 / 20 21 22 23 / a0 b1 c2 d3", o.str());
}

TEST(State, FromBytesRejectsPartialBlocks) {
  State state;
  EXPECT_INVALID_ARGUMENT(State::from_bytes(&state, std::vector<uint8_t>(15)));
  EXPECT_INVALID_ARGUMENT(State::from_bytes(&state, std::vector<uint8_t>(17)));
  EXPECT_INVALID_ARGUMENT(State::from_bytes(&state, base::Bytes()));
  EXPECT_EQ(State(), state);
}

TEST(State, SubBytes) {
  auto state = State::from_rows(Rows{{
      {{0x19, 0xa0, 0x9a, 0xe9}},
      {{0x3d, 0xf4, 0xc6, 0xf8}},
      {{0xe3, 0xe2, 0x8d, 0x48}},
      {{0xbe, 0x2b, 0x2a, 0x08}},
  }});
  auto expected = State::from_rows(Rows{{
      {{0xd4, 0xe0, 0xb8, 0x1e}},
      {{0x27, 0xbf, 0xb4, 0x41}},
      {{0x11, 0x98, 0x5d, 0x52}},
      {{0xae, 0xf1, 0xe5, 0x30}},
  }});
  auto orig = state;
  state.sub_bytes();
  EXPECT_EQ(expected, state);
  state.inv_sub_bytes();
  EXPECT_EQ(orig, state);
}

TEST(State, ShiftRows) {
  auto state = State::from_rows(Rows{{
      {{0x74, 0xc5, 0xdf, 0x3c}},
      {{0x6c, 0x1e, 0x93, 0x62}},
      {{0xe1, 0xdd, 0x79, 0xb0}},
      {{0x09, 0x3b, 0xc7, 0xe7}},
  }});
  auto orig = state;

  state.shift_rows();
  EXPECT_EQ(State::from_rows(Rows{{
                {{0x74, 0xc5, 0xdf, 0x3c}},
                {{0x1e, 0x93, 0x62, 0x6c}},
                {{0x79, 0xb0, 0xe1, 0xdd}},
                {{0xe7, 0x09, 0x3b, 0xc7}},
            }}),
            state);
  state.inv_shift_rows();
  EXPECT_EQ(orig, state);

  state.inv_shift_rows();
  EXPECT_EQ(State::from_rows(Rows{{
                {{0x74, 0xc5, 0xdf, 0x3c}},
                {{0x62, 0x6c, 0x1e, 0x93}},
                {{0x79, 0xb0, 0xe1, 0xdd}},
                {{0x3b, 0xc7, 0xe7, 0x09}},
            }}),
            state);
}

TEST(State, MixColumn) {
  struct TestRow {
    Word in;
    Word out;
  };
  std::vector<TestRow> testdata = {
      {{{0xdb, 0x13, 0x53, 0x45}}, {{0x8e, 0x4d, 0xa1, 0xbc}}},
      {{{0xf2, 0x0a, 0x22, 0x5c}}, {{0x9f, 0xdc, 0x58, 0x9d}}},
      {{{0x01, 0x01, 0x01, 0x01}}, {{0x01, 0x01, 0x01, 0x01}}},
      {{{0xc6, 0xc6, 0xc6, 0xc6}}, {{0xc6, 0xc6, 0xc6, 0xc6}}},
      {{{0xd4, 0xd4, 0xd4, 0xd5}}, {{0xd5, 0xd5, 0xd7, 0xd6}}},
      {{{0x2d, 0x26, 0x31, 0x4c}}, {{0x4d, 0x7e, 0xbd, 0xf8}}},
  };
  for (const auto& row : testdata) {
    Word w = row.in;
    crypto::cipher::mix_column(&w);
    EXPECT_EQ(row.out, w);
    crypto::cipher::inv_mix_column(&w);
    EXPECT_EQ(row.in, w);
  }
}

TEST(State, MixColumns) {
  auto state = State::from_rows(Rows{{
      {{0xd4, 0xe0, 0xb8, 0x1e}},
      {{0xbf, 0xb4, 0x41, 0x27}},
      {{0x5d, 0x52, 0x11, 0x98}},
      {{0x30, 0xae, 0xf1, 0xe5}},
  }});
  auto orig = state;
  state.mix_columns();
  EXPECT_EQ(State::from_rows(Rows{{
                {{0x04, 0xe0, 0x48, 0x28}},
                {{0x66, 0xcb, 0xf8, 0x06}},
                {{0x81, 0x19, 0xd3, 0x26}},
                {{0xe5, 0x9a, 0x7a, 0x4c}},
            }}),
            state);
  state.inv_mix_columns();
  EXPECT_EQ(orig, state);
}

TEST(State, AddRoundKey) {
  auto state = State::from_rows(Rows{{
      {{0x04, 0xe0, 0x48, 0x28}},
      {{0x66, 0xcb, 0xf8, 0x06}},
      {{0x81, 0x19, 0xd3, 0x26}},
      {{0xe5, 0x9a, 0x7a, 0x4c}},
  }});
  auto rk = RoundKey::from_rows(Rows{{
      {{0xa0, 0x88, 0x23, 0x2a}},
      {{0xfa, 0x54, 0xa3, 0x6c}},
      {{0xfe, 0x2c, 0x39, 0x76}},
      {{0x17, 0xb1, 0x39, 0x05}},
  }});
  auto orig = state;
  state.add_round_key(rk);
  EXPECT_EQ(State::from_rows(Rows{{
                {{0xa4, 0x68, 0x6b, 0x02}},
                {{0x9c, 0x9f, 0x5b, 0x6a}},
                {{0x7f, 0x35, 0xea, 0x50}},
                {{0xf2, 0x2b, 0x43, 0x49}},
            }}),
            state);
  state.add_round_key(rk);
  EXPECT_EQ(orig, state);
}

TEST(State, Inverses) {
  std::mt19937 rng(0x5eed);
  for (int i = 0; i < 256; ++i) {
    State state = random_state(&rng);
    State orig = state;

    state.shift_rows();
    state.inv_shift_rows();
    EXPECT_EQ(orig, state);

    state.mix_columns();
    state.inv_mix_columns();
    EXPECT_EQ(orig, state);

    state.sub_bytes();
    state.inv_sub_bytes();
    EXPECT_EQ(orig, state);
  }
}
