// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/cipher/ecb.h"

#include "base/backport.h"
#include "base/logging.h"

namespace crypto {
namespace cipher {
inline namespace implementation {
using BlockFunc = void (BlockCrypter::*)(base::MutableBytes, base::Bytes) const;

static base::Result ecb_apply(BlockFunc func, const char* what,
                              const BlockCrypter& block,
                              base::MutableBytes dst, base::Bytes src) {
  std::size_t blksz = block.block_size();
  if (src.size() % blksz != 0) {
    return base::Result::invalid_argument(
        "ECB ", what, " requires a multiple of ", blksz, " bytes, got ",
        src.size(), " bytes");
  }
  CHECK_GE(dst.size(), src.size());

  uint8_t* dptr = dst.data();
  const uint8_t* sptr = src.data();
  std::size_t len = src.size();
  while (len >= blksz) {
    (block.*func)(base::MutableBytes(dptr, blksz), base::Bytes(sptr, blksz));
    dptr += blksz;
    sptr += blksz;
    len -= blksz;
  }
  return base::Result();
}

class ECBCrypter : public Crypter {
 public:
  explicit ECBCrypter(std::unique_ptr<BlockCrypter> block)
      : block_(CHECK_NOTNULL(std::move(block))) {}
  bool is_streaming() const noexcept override { return false; }
  uint16_t block_size() const noexcept override { return block_->block_size(); }
  base::Result encrypt(base::MutableBytes dst, base::Bytes src) override {
    return ecb_encrypt(*block_, dst, src);
  }
  base::Result decrypt(base::MutableBytes dst, base::Bytes src) override {
    return ecb_decrypt(*block_, dst, src);
  }

 private:
  std::unique_ptr<BlockCrypter> block_;
};
}  // inline namespace implementation

base::Result ecb_encrypt(const BlockCrypter& block, base::MutableBytes dst,
                         base::Bytes src) {
  return ecb_apply(&BlockCrypter::block_encrypt, "encryption", block, dst,
                   src);
}

base::Result ecb_decrypt(const BlockCrypter& block, base::MutableBytes dst,
                         base::Bytes src) {
  return ecb_apply(&BlockCrypter::block_decrypt, "decryption", block, dst,
                   src);
}

base::Result new_ecb(std::unique_ptr<Crypter>* out,
                     std::unique_ptr<BlockCrypter> block, base::Bytes iv) {
  CHECK_NOTNULL(out);
  if (!iv.empty()) {
    return base::Result::invalid_argument("ECB mode takes no IV, got ",
                                          iv.size(), " bytes");
  }
  *out = base::backport::make_unique<ECBCrypter>(std::move(block));
  return base::Result();
}
}  // namespace cipher
}  // namespace crypto

static const crypto::BlockCipherMode ECB = {
    0,                        // iv_size
    "ECB",                    // name
    crypto::cipher::new_ecb,  // newfn
};

static void init() __attribute__((constructor));
static void init() { crypto::register_mode(&ECB); }
