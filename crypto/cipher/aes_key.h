// crypto/cipher/aes_key.h - AES keys and the AES-128 key schedule
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_AES_KEY_H
#define CRYPTO_CIPHER_AES_KEY_H

#include <array>
#include <cstdint>
#include <ostream>

#include "base/bytes.h"
#include "base/result.h"
#include "crypto/cipher/aes.h"
#include "crypto/cipher/aes_gf.h"

namespace crypto {
namespace cipher {

// Rcon: successive powers of x in GF(2^8), one per AES-128 round.
extern const uint8_t ROUND_CONSTANTS[10];

// [a, b, c, d] -> [b, c, d, a]
void rot_word(Word* w) noexcept;

// Replaces each byte of |w| with its SBOX_0 entry.
void sub_word(Word* w) noexcept;

// RoundKey is one 16-byte entry of the key schedule.
// Bytes are stored column-major, exactly like State.
class RoundKey {
 public:
  constexpr RoundKey() noexcept : bytes_() {}
  explicit RoundKey(const AESBlock& bytes) noexcept : bytes_(bytes) {}

  static RoundKey from_rows(const std::array<Word, 4>& rows) noexcept;

  Word column(std::size_t c) const noexcept;
  void set_column(std::size_t c, const Word& w) noexcept;

  uint8_t at(std::size_t r, std::size_t c) const noexcept {
    return bytes_[c * 4 + r];
  }

  const AESBlock& bytes() const noexcept { return bytes_; }

 private:
  AESBlock bytes_;
};

inline bool operator==(const RoundKey& a, const RoundKey& b) noexcept {
  return a.bytes() == b.bytes();
}
inline bool operator!=(const RoundKey& a, const RoundKey& b) noexcept {
  return !(a == b);
}

std::ostream& operator<<(std::ostream& o, const RoundKey& rk);

using RoundKeys = std::array<RoundKey, AES128_ROUNDKEYS>;

// Key holds raw AES key material, tagged with the AESVariant that its length
// selects.  A default-constructed Key is empty and has no variant.
//
// The key bytes are wiped when the Key is destroyed.
//
class Key {
 public:
  Key() noexcept : variant_(nullptr), bytes_() {}
  Key(const Key&) noexcept = default;
  Key& operator=(const Key&) noexcept = default;
  ~Key() noexcept;

  // Copies |raw| into |out|.
  // Returns INVALID_ARGUMENT if |raw| is not 16, 24, or 32 bytes long.
  static base::Result from_bytes(Key* out, base::Bytes raw);

  const AESVariant* variant() const noexcept { return variant_; }
  std::size_t size() const noexcept {
    return variant_ ? variant_->key_size : 0;
  }
  base::Bytes bytes() const noexcept {
    return base::Bytes(bytes_.data(), size());
  }

  // Returns 4-byte column |c| of the key, c < size() / 4.
  Word column(std::size_t c) const noexcept;

 private:
  const AESVariant* variant_;
  std::array<uint8_t, AES256_KEYSIZE> bytes_;
};

// Expands |key| into the full AES-128 key schedule.
//
// Returns NOT_IMPLEMENTED for AES-192 and AES-256 keys, and INVALID_ARGUMENT
// for an empty Key.  On failure, |out| is not touched.
//
base::Result expand_key(RoundKeys* out, const Key& key);

}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_AES_KEY_H
