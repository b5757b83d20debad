// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/cipher/aes_state.h"

#include <cstring>
#include <iomanip>

#include "base/logging.h"
#include "crypto/cipher/aes_sbox.h"

using crypto::cipher::Word;
using crypto::cipher::gf::mult;

static void rotate_left(Word* w, std::size_t n) noexcept {
  Word tmp = *w;
  for (std::size_t i = 0; i < 4; ++i) {
    (*w)[i] = tmp[(i + n) % 4];
  }
}

// out[i] = m[0] * w[i] ^ m[1] * w[i+1] ^ m[2] * w[i+2] ^ m[3] * w[i+3]
// where the MDS matrix is circulant with first row |m|.
static void circulant_mult(Word* w, const Word& m) noexcept {
  Word in = *w;
  for (std::size_t i = 0; i < 4; ++i) {
    uint8_t x = 0;
    for (std::size_t j = 0; j < 4; ++j) {
      x ^= mult(m[j], in[(i + j) % 4]);
    }
    (*w)[i] = x;
  }
}

namespace crypto {
namespace cipher {

static const Word MIX = {{0x02, 0x03, 0x01, 0x01}};
static const Word INV_MIX = {{0x0e, 0x0b, 0x0d, 0x09}};

void mix_column(Word* w) noexcept { circulant_mult(w, MIX); }

void inv_mix_column(Word* w) noexcept { circulant_mult(w, INV_MIX); }

State State::from_rows(const std::array<Word, 4>& rows) noexcept {
  State state;
  for (std::size_t r = 0; r < 4; ++r) {
    state.set_row(r, rows[r]);
  }
  return state;
}

base::Result State::from_bytes(State* out, base::Bytes raw) {
  CHECK_NOTNULL(out);
  if (raw.size() != AES_BLOCKSIZE) {
    return base::Result::invalid_argument("AES block must be ", AES_BLOCKSIZE,
                                          " bytes long, got ", raw.size(),
                                          " bytes");
  }
  ::memcpy(out->bytes_.data(), raw.data(), AES_BLOCKSIZE);
  return base::Result();
}

Word State::column(std::size_t c) const noexcept {
  DCHECK_LT(c, 4U);
  Word w;
  ::memcpy(w.data(), bytes_.data() + c * 4, 4);
  return w;
}

void State::set_column(std::size_t c, const Word& w) noexcept {
  DCHECK_LT(c, 4U);
  ::memcpy(bytes_.data() + c * 4, w.data(), 4);
}

Word State::row(std::size_t r) const noexcept {
  DCHECK_LT(r, 4U);
  Word w;
  for (std::size_t c = 0; c < 4; ++c) w[c] = at(r, c);
  return w;
}

void State::set_row(std::size_t r, const Word& w) noexcept {
  DCHECK_LT(r, 4U);
  for (std::size_t c = 0; c < 4; ++c) at(r, c) = w[c];
}

void State::sub_bytes() noexcept {
  for (auto& byte : bytes_) byte = SBOX_0[byte];
}

void State::inv_sub_bytes() noexcept {
  for (auto& byte : bytes_) byte = SBOX_1[byte];
}

void State::shift_rows() noexcept {
  for (std::size_t r = 1; r < 4; ++r) {
    Word w = row(r);
    rotate_left(&w, r);
    set_row(r, w);
  }
}

void State::inv_shift_rows() noexcept {
  for (std::size_t r = 1; r < 4; ++r) {
    Word w = row(r);
    rotate_left(&w, 4 - r);
    set_row(r, w);
  }
}

void State::mix_columns() noexcept {
  for (std::size_t c = 0; c < 4; ++c) {
    Word w = column(c);
    mix_column(&w);
    set_column(c, w);
  }
}

void State::inv_mix_columns() noexcept {
  for (std::size_t c = 0; c < 4; ++c) {
    Word w = column(c);
    inv_mix_column(&w);
    set_column(c, w);
  }
}

void State::add_round_key(const RoundKey& rk) noexcept {
  for (std::size_t c = 0; c < 4; ++c) {
    set_column(c, gf::add_word(column(c), rk.column(c)));
  }
}

std::ostream& operator<<(std::ostream& o, const State& state) {
  auto flags = o.flags();
  auto fill = o.fill('0');
  o << std::hex;
  for (std::size_t r = 0; r < 4; ++r) {
    if (r != 0) o << " / ";
    for (std::size_t c = 0; c < 4; ++c) {
      if (c != 0) o << ' ';
      o << std::setw(2) << static_cast<unsigned int>(state.at(r, c));
    }
  }
  o.fill(fill);
  o.flags(flags);
  return o;
}

}  // namespace cipher
}  // namespace crypto
