// crypto/cipher/aes.h - AES block cipher (FIPS-197)
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_AES_H
#define CRYPTO_CIPHER_AES_H

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "base/bytes.h"
#include "base/result.h"
#include "crypto/crypto.h"

namespace crypto {
namespace cipher {

constexpr uint32_t AES_BLOCKSIZE = 16;
constexpr uint32_t AES128_KEYSIZE = 16;
constexpr uint32_t AES192_KEYSIZE = 24;
constexpr uint32_t AES256_KEYSIZE = 32;

// Number of round keys in an AES-128 key schedule.
constexpr uint32_t AES128_ROUNDKEYS = 11;

using AESBlock = std::array<uint8_t, AES_BLOCKSIZE>;

// AESVariant describes one member of the AES family.
//
// Only AES-128 is |supported|.  The other variants are known by name so that
// callers asking for them get NOT_IMPLEMENTED rather than NOT_FOUND.
//
struct AESVariant {
  const char* name;
  uint16_t key_size;  // in bytes
  uint16_t num_rounds;
  uint16_t round_key_count;
  bool supported;
};

extern const AESVariant AES128_VARIANT;
extern const AESVariant AES192_VARIANT;
extern const AESVariant AES256_VARIANT;

// Returns the variant whose key is |key_size| bytes long, or nullptr.
const AESVariant* aes_variant(std::size_t key_size) noexcept;

// Constructs an AES BlockCrypter.
//
// Returns INVALID_ARGUMENT if |key| is not 16, 24, or 32 bytes long, and
// NOT_IMPLEMENTED if it is 24 or 32 bytes long.
//
base::Result new_aes(std::unique_ptr<BlockCrypter>* out, base::Bytes key);

// Constructs an AES Crypter in ECB mode.  Equivalent to
// new_crypter(out, "AES-128+ECB", key, {}) for 16-byte keys.
base::Result new_aes_ecb(std::unique_ptr<Crypter>* out, base::Bytes key);

// Encrypts or decrypts |in| with AES in ECB mode, storing the result in
// |out|.
//
// |in| is processed as consecutive 16-byte blocks, each transformed
// independently with the same key schedule.  No padding is added or removed:
// if |in.size()| is not a multiple of 16, the result is INVALID_ARGUMENT and
// |out| is not touched.
//
base::Result aes_ecb_encrypt(std::vector<uint8_t>* out, base::Bytes key,
                             base::Bytes in);
base::Result aes_ecb_decrypt(std::vector<uint8_t>* out, base::Bytes key,
                             base::Bytes in);

}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_AES_H
