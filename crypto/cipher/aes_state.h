// crypto/cipher/aes_state.h - The AES State matrix and round transformations
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_AES_STATE_H
#define CRYPTO_CIPHER_AES_STATE_H

#include <array>
#include <cstdint>
#include <ostream>

#include "base/bytes.h"
#include "base/result.h"
#include "crypto/cipher/aes.h"
#include "crypto/cipher/aes_gf.h"
#include "crypto/cipher/aes_key.h"

namespace crypto {
namespace cipher {

// State is the 4x4 byte matrix that the AES rounds operate on.
//
// Bytes are stored column-major: linear index |c * 4 + r| holds the byte at
// row |r|, column |c|.  This is also the order in which a 16-byte input block
// is loaded and an output block is stored.
//
class State {
 public:
  constexpr State() noexcept : bytes_() {}
  explicit State(const AESBlock& block) noexcept : bytes_(block) {}

  static State from_rows(const std::array<Word, 4>& rows) noexcept;

  // Loads exactly one block.
  // Returns INVALID_ARGUMENT if |raw| is not 16 bytes long.
  static base::Result from_bytes(State* out, base::Bytes raw);

  uint8_t& at(std::size_t r, std::size_t c) noexcept {
    return bytes_[c * 4 + r];
  }
  uint8_t at(std::size_t r, std::size_t c) const noexcept {
    return bytes_[c * 4 + r];
  }

  Word column(std::size_t c) const noexcept;
  void set_column(std::size_t c, const Word& w) noexcept;
  Word row(std::size_t r) const noexcept;
  void set_row(std::size_t r, const Word& w) noexcept;

  const AESBlock& bytes() const noexcept { return bytes_; }

  // SubBytes / InvSubBytes: substitute every byte through SBOX_0 / SBOX_1.
  void sub_bytes() noexcept;
  void inv_sub_bytes() noexcept;

  // ShiftRows rotates row |r| left by |r| bytes.
  // InvShiftRows rotates row |r| right by |r| bytes.
  void shift_rows() noexcept;
  void inv_shift_rows() noexcept;

  // MixColumns / InvMixColumns: apply |mix_column| / |inv_mix_column| to
  // each of the four columns.
  void mix_columns() noexcept;
  void inv_mix_columns() noexcept;

  // AddRoundKey: XOR |rk| into the State, column by column.
  // Self-inverse.
  void add_round_key(const RoundKey& rk) noexcept;

 private:
  AESBlock bytes_;
};

inline bool operator==(const State& a, const State& b) noexcept {
  return a.bytes() == b.bytes();
}
inline bool operator!=(const State& a, const State& b) noexcept {
  return !(a == b);
}

// Prints the State as four rows of hex bytes separated by " / ".
std::ostream& operator<<(std::ostream& o, const State& state);

// Multiplies the column |w| by the MixColumns matrix
//
//   02 03 01 01
//   01 02 03 01
//   01 01 02 03
//   03 01 01 02
//
void mix_column(Word* w) noexcept;

// Multiplies the column |w| by the InvMixColumns matrix
//
//   0e 0b 0d 09
//   09 0e 0b 0d
//   0d 09 0e 0b
//   0b 0d 09 0e
//
void inv_mix_column(Word* w) noexcept;

}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_AES_STATE_H
