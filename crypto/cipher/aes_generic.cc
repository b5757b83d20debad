// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/cipher/aes_internal.h"

#include <cstring>

#include "base/logging.h"

namespace crypto {
namespace cipher {
inline namespace implementation {

void aes_cipher(State* state, const RoundKeys& keys) noexcept {
  const std::size_t n = keys.size();

  // Round 0: AddRoundKey
  state->add_round_key(keys[0]);

  // Rounds 1 .. N - 2: SubBytes, ShiftRows, MixColumns, AddRoundKey
  for (std::size_t round = 1; round < n - 1; ++round) {
    state->sub_bytes();
    state->shift_rows();
    state->mix_columns();
    state->add_round_key(keys[round]);
  }

  // Round N - 1: SubBytes, ShiftRows, AddRoundKey (no MixColumns)
  state->sub_bytes();
  state->shift_rows();
  state->add_round_key(keys[n - 1]);
}

void aes_inv_cipher(State* state, const RoundKeys& keys) noexcept {
  const std::size_t n = keys.size();

  // Round N - 1: AddRoundKey
  state->add_round_key(keys[n - 1]);

  // Rounds N - 2 .. 1: InvShiftRows, InvSubBytes, AddRoundKey, InvMixColumns
  for (std::size_t round = n - 2; round >= 1; --round) {
    state->inv_shift_rows();
    state->inv_sub_bytes();
    state->add_round_key(keys[round]);
    state->inv_mix_columns();
  }

  // Round 0: InvShiftRows, InvSubBytes, AddRoundKey (no InvMixColumns)
  state->inv_shift_rows();
  state->inv_sub_bytes();
  state->add_round_key(keys[0]);
}

AESBlock aes_encrypt_block(const AESBlock& in, const RoundKeys& keys) noexcept {
  State state(in);
  aes_cipher(&state, keys);
  return state.bytes();
}

AESBlock aes_decrypt_block(const AESBlock& in, const RoundKeys& keys) noexcept {
  State state(in);
  aes_inv_cipher(&state, keys);
  return state.bytes();
}

template <typename BlockFunc>
static void aes_generic_loop(BlockFunc func, const RoundKeys& keys,
                             uint8_t* dst, const uint8_t* src,
                             std::size_t len) noexcept {
  AESBlock block;
  while (len >= AES_BLOCKSIZE) {
    ::memcpy(block.data(), src, AES_BLOCKSIZE);
    block = func(block, keys);
    ::memcpy(dst, block.data(), AES_BLOCKSIZE);
    src += AES_BLOCKSIZE;
    dst += AES_BLOCKSIZE;
    len -= AES_BLOCKSIZE;
  }
  DCHECK_EQ(len, 0U);
  block.fill(0);
}

void aes_generic_encrypt(const RoundKeys& keys, uint8_t* dst,
                         const uint8_t* src, std::size_t len) noexcept {
  aes_generic_loop(aes_encrypt_block, keys, dst, src, len);
}

void aes_generic_decrypt(const RoundKeys& keys, uint8_t* dst,
                         const uint8_t* src, std::size_t len) noexcept {
  aes_generic_loop(aes_decrypt_block, keys, dst, src, len);
}

}  // inline namespace implementation
}  // namespace cipher
}  // namespace crypto
