// crypto/cipher/aes_sbox.h - AES substitution tables
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_AES_SBOX_H
#define CRYPTO_CIPHER_AES_SBOX_H

#include <cstdint>

namespace crypto {
namespace cipher {

// The AES S-box: SBOX_0 is the forward substitution (SubBytes), and SBOX_1
// is its inverse (InvSubBytes).  SBOX_0[SBOX_1[x]] == x for all x.
extern const uint8_t SBOX_0[256];
extern const uint8_t SBOX_1[256];

}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_AES_SBOX_H
