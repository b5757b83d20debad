// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CRYPTO_H
#define CRYPTO_CRYPTO_H

#include <cstdint>
#include <memory>
#include <vector>

#include "base/bytes.h"
#include "base/chars.h"
#include "base/result.h"

namespace crypto {

// Provides an interface to a low-level block cipher algorithm.
class BlockCrypter {
 protected:
  BlockCrypter() noexcept = default;

 public:
  virtual ~BlockCrypter() noexcept = default;

  // Returns the block size of the cipher.
  virtual uint16_t block_size() const noexcept = 0;

  // Encrypts one or more blocks of data.
  //
  // Length of |src| must be an exact multiple of |block_size()|.
  // Length of |dst| must equal or exceed the length of |src|.
  // Only the first |src.size()| bytes of |dst| will be touched.
  //
  // |dst| may equal |src|.  Other than that, they must not overlap.
  //
  // WARNING: DO NOT CALL THIS METHOD DIRECTLY!
  // To use a block cipher safely, wrap it in a block cipher mode.
  //
  virtual void block_encrypt(base::MutableBytes dst, base::Bytes src) const = 0;

  // Decrypts one or more blocks of data.
  //
  // Same requirements as |block_encrypt()|.
  //
  virtual void block_decrypt(base::MutableBytes dst, base::Bytes src) const = 0;

  BlockCrypter(const BlockCrypter&) = delete;
  BlockCrypter(BlockCrypter&&) = delete;
  BlockCrypter& operator=(const BlockCrypter&) = delete;
  BlockCrypter& operator=(BlockCrypter&&) noexcept = delete;
};

// Provides an interface to a low-level block cipher algorithm wrapped in a
// block cipher mode.
class Crypter {
 protected:
  Crypter() noexcept = default;

 public:
  virtual ~Crypter() noexcept = default;

  // Returns true iff inputs need not lie on a |block_size()| boundary.
  virtual bool is_streaming() const noexcept = 0;

  // Returns the block size of the cipher.
  //
  // For non-streaming ciphers, the inputs provided to |encrypt()| and
  // |decrypt()| MUST have lengths that are multiples of this number, or else
  // INVALID_ARGUMENT is returned and |dst| is not touched.
  //
  virtual uint16_t block_size() const noexcept = 0;

  // Encrypts some data.
  //
  // |dst| may equal |src|.  Other than that, they must not overlap.
  //
  // |dst| must be at least as long as |src|.  If |dst| is longer, then only
  // the first |src.size()| bytes of |dst| will be touched.
  //
  virtual base::Result encrypt(base::MutableBytes dst, base::Bytes src) = 0;

  // Decrypts some data.  Same requirements as |encrypt()|.
  virtual base::Result decrypt(base::MutableBytes dst, base::Bytes src) = 0;

  Crypter(const Crypter&) = delete;
  Crypter(Crypter&&) = delete;
  Crypter& operator=(const Crypter&) = delete;
  Crypter& operator=(Crypter&&) noexcept = delete;
};

using NewBlockCrypter = base::Result (*)(std::unique_ptr<BlockCrypter>* out,
                                         base::Bytes key);
using NewBlockCrypterForMode = base::Result (*)(
    std::unique_ptr<Crypter>* out, std::unique_ptr<BlockCrypter> block,
    base::Bytes iv);

struct BlockCipher {
  enum {
    // Indicates that the BlockCipher is known by name, but |newfn| will
    // always fail with NOT_IMPLEMENTED.
    FLAG_UNIMPLEMENTED = (1U << 0),
  };

  uint16_t block_size;
  uint16_t key_size;
  uint16_t num_rounds;
  uint8_t flags;
  const char* name;
  NewBlockCrypter newfn;
};

struct BlockCipherMode {
  uint16_t iv_size;  // in bytes
  const char* name;
  NewBlockCrypterForMode newfn;
};

// Lists registered algorithms, sorted by name.
std::vector<const BlockCipher*> all_block_ciphers();
std::vector<const BlockCipherMode*> all_modes();

// Finds a registered algorithm.  Matching ignores case and punctuation, so
// "aes128" finds "AES-128".  Returns NOT_FOUND if there is no match.
base::Result find_block_cipher(const BlockCipher** out, base::Chars name);
base::Result find_mode(const BlockCipherMode** out, base::Chars name);

void register_block_cipher(const BlockCipher* ptr);
void register_mode(const BlockCipherMode* ptr);

// Constructs a Crypter from a name of the form "<cipher>+<mode>",
// e.g. "AES-128+ECB".
base::Result new_crypter(std::unique_ptr<Crypter>* out, base::Chars name,
                         base::Bytes key, base::Bytes iv);

}  // namespace crypto

#endif  // CRYPTO_CRYPTO_H
