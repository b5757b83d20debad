// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/cipher/aes.h"

#include <cstdint>

#include "base/backport.h"
#include "base/logging.h"
#include "crypto/cipher/aes_internal.h"
#include "crypto/cipher/ecb.h"
#include "crypto/subtle.h"

namespace crypto {
namespace cipher {

const AESVariant AES128_VARIANT = {"AES-128", AES128_KEYSIZE, 10, 11, true};
const AESVariant AES192_VARIANT = {"AES-192", AES192_KEYSIZE, 12, 13, false};
const AESVariant AES256_VARIANT = {"AES-256", AES256_KEYSIZE, 14, 15, false};

const AESVariant* aes_variant(std::size_t key_size) noexcept {
  switch (key_size) {
    case AES128_KEYSIZE:
      return &AES128_VARIANT;

    case AES192_KEYSIZE:
      return &AES192_VARIANT;

    case AES256_KEYSIZE:
      return &AES256_VARIANT;

    default:
      return nullptr;
  }
}

inline namespace implementation {
class AESBlockCrypter : public BlockCrypter {
 public:
  AESBlockCrypter() = default;
  uint16_t block_size() const noexcept override { return AES_BLOCKSIZE; }
  void block_encrypt(base::MutableBytes dst, base::Bytes src) const
      noexcept override;
  void block_decrypt(base::MutableBytes dst, base::Bytes src) const
      noexcept override;

  RoundKeys* mutable_keys() noexcept { return keys_.get(); }

 private:
  crypto::subtle::SecureMemory<RoundKeys> keys_;
};

void AESBlockCrypter::block_encrypt(base::MutableBytes dst,
                                    base::Bytes src) const noexcept {
  DCHECK_GE(dst.size(), src.size());
  aes_generic_encrypt(*keys_, dst.data(), src.data(), src.size());
}

void AESBlockCrypter::block_decrypt(base::MutableBytes dst,
                                    base::Bytes src) const noexcept {
  DCHECK_GE(dst.size(), src.size());
  aes_generic_decrypt(*keys_, dst.data(), src.data(), src.size());
}

using ECBFunc = base::Result (*)(const BlockCrypter&, base::MutableBytes,
                                 base::Bytes);

static base::Result aes_ecb(ECBFunc func, std::vector<uint8_t>* out,
                            base::Bytes key, base::Bytes in) {
  CHECK_NOTNULL(out);
  if (in.size() % AES_BLOCKSIZE != 0) {
    return base::Result::invalid_argument(
        "AES-ECB input must be a multiple of ", AES_BLOCKSIZE,
        " bytes long, got ", in.size(), " bytes");
  }

  std::unique_ptr<BlockCrypter> block;
  auto result = new_aes(&block, key);
  if (!result) return result;

  std::vector<uint8_t> tmp(in.size());
  result = func(*block, tmp, in);
  if (!result) return result;
  out->swap(tmp);
  return base::Result();
}
}  // inline namespace implementation

base::Result new_aes(std::unique_ptr<BlockCrypter>* out, base::Bytes key) {
  CHECK_NOTNULL(out);
  Key k;
  auto result = Key::from_bytes(&k, key);
  if (!result) return result;

  auto crypter = base::backport::make_unique<AESBlockCrypter>();
  result = expand_key(crypter->mutable_keys(), k);
  if (!result) return result;
  *out = std::move(crypter);
  return base::Result();
}

base::Result new_aes_ecb(std::unique_ptr<Crypter>* out, base::Bytes key) {
  CHECK_NOTNULL(out);
  std::unique_ptr<BlockCrypter> block;
  auto result = new_aes(&block, key);
  if (!result) return result;
  return new_ecb(out, std::move(block), base::Bytes());
}

base::Result aes_ecb_encrypt(std::vector<uint8_t>* out, base::Bytes key,
                             base::Bytes in) {
  return aes_ecb(ecb_encrypt, out, key, in);
}

base::Result aes_ecb_decrypt(std::vector<uint8_t>* out, base::Bytes key,
                             base::Bytes in) {
  return aes_ecb(ecb_decrypt, out, key, in);
}

}  // namespace cipher
}  // namespace crypto

static const crypto::BlockCipher AES128 = {
    crypto::cipher::AES_BLOCKSIZE,   // block_size
    crypto::cipher::AES128_KEYSIZE,  // key_size
    10,                              // num_rounds
    0,                               // flags
    "AES-128",                       // name
    crypto::cipher::new_aes,         // newfn
};

static const crypto::BlockCipher AES192 = {
    crypto::cipher::AES_BLOCKSIZE,          // block_size
    crypto::cipher::AES192_KEYSIZE,         // key_size
    12,                                     // num_rounds
    crypto::BlockCipher::FLAG_UNIMPLEMENTED,  // flags
    "AES-192",                              // name
    crypto::cipher::new_aes,                // newfn
};

static const crypto::BlockCipher AES256 = {
    crypto::cipher::AES_BLOCKSIZE,          // block_size
    crypto::cipher::AES256_KEYSIZE,         // key_size
    14,                                     // num_rounds
    crypto::BlockCipher::FLAG_UNIMPLEMENTED,  // flags
    "AES-256",                              // name
    crypto::cipher::new_aes,                // newfn
};

static void init() __attribute__((constructor));
static void init() {
  crypto::register_block_cipher(&AES128);
  crypto::register_block_cipher(&AES192);
  crypto::register_block_cipher(&AES256);
}
