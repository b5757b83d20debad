// crypto/cipher/ecb.h - Electronic Codebook mode over any BlockCrypter
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_CIPHER_ECB_H
#define CRYPTO_CIPHER_ECB_H

#include <memory>

#include "base/bytes.h"
#include "base/result.h"
#include "crypto/crypto.h"

namespace crypto {
namespace cipher {

// Encrypts (decrypts) |src| into |dst| one block at a time, each block
// independently of the others.
//
// Returns INVALID_ARGUMENT, without touching |dst|, if |src.size()| is not a
// multiple of |block.block_size()|.  |dst| must be at least as long as |src|.
//
base::Result ecb_encrypt(const BlockCrypter& block, base::MutableBytes dst,
                         base::Bytes src);
base::Result ecb_decrypt(const BlockCrypter& block, base::MutableBytes dst,
                         base::Bytes src);

// Wraps |block| in ECB mode.  ECB takes no IV: a non-empty |iv| is
// INVALID_ARGUMENT.
base::Result new_ecb(std::unique_ptr<Crypter>* out,
                     std::unique_ptr<BlockCrypter> block, base::Bytes iv);

}  // namespace cipher
}  // namespace crypto

#endif  // CRYPTO_CIPHER_ECB_H
