// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/cipher/aes_key.h"

#include <strings.h>

#include <cstring>
#include <iomanip>

#include "base/logging.h"
#include "crypto/cipher/aes_sbox.h"

namespace crypto {
namespace cipher {

const uint8_t ROUND_CONSTANTS[10] = {
    0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80, 0x1b, 0x36,
};

void rot_word(Word* w) noexcept {
  Word& x = *w;
  uint8_t tmp = x[0];
  x[0] = x[1];
  x[1] = x[2];
  x[2] = x[3];
  x[3] = tmp;
}

void sub_word(Word* w) noexcept {
  for (auto& byte : *w) byte = SBOX_0[byte];
}

RoundKey RoundKey::from_rows(const std::array<Word, 4>& rows) noexcept {
  RoundKey rk;
  for (std::size_t r = 0; r < 4; ++r) {
    for (std::size_t c = 0; c < 4; ++c) {
      rk.bytes_[c * 4 + r] = rows[r][c];
    }
  }
  return rk;
}

Word RoundKey::column(std::size_t c) const noexcept {
  DCHECK_LT(c, 4U);
  Word w;
  ::memcpy(w.data(), bytes_.data() + c * 4, 4);
  return w;
}

void RoundKey::set_column(std::size_t c, const Word& w) noexcept {
  DCHECK_LT(c, 4U);
  ::memcpy(bytes_.data() + c * 4, w.data(), 4);
}

std::ostream& operator<<(std::ostream& o, const RoundKey& rk) {
  auto flags = o.flags();
  auto fill = o.fill('0');
  o << std::hex;
  for (uint8_t byte : rk.bytes()) {
    o << std::setw(2) << static_cast<unsigned int>(byte);
  }
  o.fill(fill);
  o.flags(flags);
  return o;
}

Key::~Key() noexcept { ::bzero(bytes_.data(), bytes_.size()); }

base::Result Key::from_bytes(Key* out, base::Bytes raw) {
  CHECK_NOTNULL(out);
  const AESVariant* variant = aes_variant(raw.size());
  if (variant == nullptr) {
    return base::Result::invalid_argument(
        "AES key must be 16, 24, or 32 bytes long, got ", raw.size(),
        " bytes");
  }
  out->variant_ = variant;
  out->bytes_.fill(0);
  ::memcpy(out->bytes_.data(), raw.data(), raw.size());
  return base::Result();
}

Word Key::column(std::size_t c) const noexcept {
  DCHECK_LT(c * 4, size());
  Word w;
  ::memcpy(w.data(), bytes_.data() + c * 4, 4);
  return w;
}

base::Result expand_key(RoundKeys* out, const Key& key) {
  CHECK_NOTNULL(out);
  const AESVariant* variant = key.variant();
  if (variant == nullptr) {
    return base::Result::invalid_argument("AES key is empty");
  }
  if (!variant->supported) {
    return base::Result::not_implemented(variant->name,
                                         " key schedule is not implemented");
  }
  VLOG(2) << "expanding " << variant->name << " key into "
          << variant->round_key_count << " round keys";

  RoundKeys& rks = *out;
  for (std::size_t c = 0; c < 4; ++c) {
    rks[0].set_column(c, key.column(c));
  }

  for (std::size_t i = 1; i < rks.size(); ++i) {
    const RoundKey& prev = rks[i - 1];
    RoundKey& next = rks[i];

    Word w = prev.column(3);
    rot_word(&w);
    sub_word(&w);
    w[0] ^= ROUND_CONSTANTS[i - 1];
    w = gf::add_word(w, prev.column(0));
    next.set_column(0, w);

    for (std::size_t c = 1; c < 4; ++c) {
      w = gf::add_word(w, prev.column(c));
      next.set_column(c, w);
    }
  }
  return base::Result();
}

}  // namespace cipher
}  // namespace crypto
