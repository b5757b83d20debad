// crypto/cipher/aes_internal.h - AES round sequencing, for tests and aes.cc
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_AES_INTERNAL_H
#define CRYPTO_CIPHER_AES_INTERNAL_H

#include <cstdint>

#include "crypto/cipher/aes.h"
#include "crypto/cipher/aes_key.h"
#include "crypto/cipher/aes_state.h"

namespace crypto {
namespace cipher {
inline namespace implementation {

// Encrypts |state| in place.
void aes_cipher(State* state, const RoundKeys& keys) noexcept;

// Decrypts |state| in place.
void aes_inv_cipher(State* state, const RoundKeys& keys) noexcept;

AESBlock aes_encrypt_block(const AESBlock& in, const RoundKeys& keys) noexcept;
AESBlock aes_decrypt_block(const AESBlock& in, const RoundKeys& keys) noexcept;

// Process |len| bytes, which must be a multiple of AES_BLOCKSIZE.
// |dst| may equal |src|.
void aes_generic_encrypt(const RoundKeys& keys, uint8_t* dst,
                         const uint8_t* src, std::size_t len) noexcept;
void aes_generic_decrypt(const RoundKeys& keys, uint8_t* dst,
                         const uint8_t* src, std::size_t len) noexcept;

}  // inline namespace implementation
}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_AES_INTERNAL_H
