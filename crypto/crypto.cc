// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/crypto.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "base/logging.h"

// Makes sausage out of an algorithm name.  Sausages may be compared for
// equality, enabling human-friendly matching of algorithm names.
static std::string canonical_name(base::Chars in) {
  std::string out;
  out.reserve(in.size());
  for (char ch : in) {
    if (ch >= '0' && ch <= '9') {
      out.push_back(ch);
    } else if (ch >= 'a' && ch <= 'z') {
      out.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      out.push_back(ch + ('a' - 'A'));
    }
  }
  return out;
}

static const RE2& crypter_name_regexp() {
  static const RE2& ref = *new RE2("\\s*([^+\\s]+)\\s*\\+\\s*([^+\\s]+)\\s*");
  return ref;
}

namespace crypto {

static std::mutex g_mu;
static std::vector<const BlockCipher*>* g_block = nullptr;
static std::vector<const BlockCipherMode*>* g_mode = nullptr;

template <typename T>
static std::vector<const T*> all_impl(std::vector<const T*>* gptr) {
  std::unique_lock<std::mutex> lock(g_mu);
  std::vector<const T*> out;
  if (gptr) out = *gptr;
  return out;
}

template <typename T>
static base::Result find_impl(std::vector<const T*>* gptr, const char* type,
                              const T** out, base::Chars name) {
  CHECK_NOTNULL(out);
  std::unique_lock<std::mutex> lock(g_mu);
  if (gptr) {
    auto cname = canonical_name(name);
    for (const T* ptr : *gptr) {
      if (canonical_name(ptr->name) == cname) {
        *out = ptr;
        return base::Result();
      }
    }
  }
  return base::Result::not_found(type, " \"", name, "\" was not found");
}

template <typename T>
static void register_impl(std::vector<const T*>** gptrptr, const T* ptr) {
  CHECK_NOTNULL(gptrptr);
  std::unique_lock<std::mutex> lock(g_mu);
  if (!*gptrptr) *gptrptr = new std::vector<const T*>;
  auto& vec = **gptrptr;
  vec.push_back(ptr);
  std::sort(vec.begin(), vec.end(), [](const T* a, const T* b) {
    return ::strcmp(a->name, b->name) < 0;
  });
}

std::vector<const BlockCipher*> all_block_ciphers() {
  return all_impl(g_block);
}

base::Result find_block_cipher(const BlockCipher** out, base::Chars name) {
  return find_impl(g_block, "block cipher", out, name);
}

void register_block_cipher(const BlockCipher* ptr) {
  CHECK_NOTNULL(ptr);
  CHECK_NOTNULL(ptr->name);
  CHECK_NOTNULL(ptr->newfn);
  register_impl(&g_block, ptr);
}

std::vector<const BlockCipherMode*> all_modes() { return all_impl(g_mode); }

base::Result find_mode(const BlockCipherMode** out, base::Chars name) {
  return find_impl(g_mode, "block cipher mode", out, name);
}

void register_mode(const BlockCipherMode* ptr) {
  CHECK_NOTNULL(ptr);
  CHECK_NOTNULL(ptr->name);
  CHECK_NOTNULL(ptr->newfn);
  register_impl(&g_mode, ptr);
}

base::Result new_crypter(std::unique_ptr<Crypter>* out, base::Chars name,
                         base::Bytes key, base::Bytes iv) {
  CHECK_NOTNULL(out);

  re2::StringPiece cipher_sp, mode_sp;
  if (!RE2::FullMatch(name, crypter_name_regexp(), &cipher_sp, &mode_sp)) {
    return base::Result::invalid_argument(
        "expected \"<cipher>+<mode>\", got \"", name, "\"");
  }
  base::Chars cipher_name = cipher_sp;
  base::Chars mode_name = mode_sp;

  const BlockCipher* cipher = nullptr;
  auto result = find_block_cipher(&cipher, cipher_name);
  if (!result) return result;

  const BlockCipherMode* mode = nullptr;
  result = find_mode(&mode, mode_name);
  if (!result) return result;

  if (cipher->flags & BlockCipher::FLAG_UNIMPLEMENTED) {
    return base::Result::not_implemented("block cipher \"", cipher->name,
                                         "\" is not implemented");
  }
  if (key.size() != cipher->key_size) {
    return base::Result::invalid_argument(
        "block cipher \"", cipher->name, "\" requires a ", cipher->key_size,
        "-byte key, got ", key.size(), " bytes");
  }

  std::unique_ptr<BlockCrypter> block;
  result = cipher->newfn(&block, key);
  if (!result) return result;
  return mode->newfn(out, std::move(block), iv);
}

}  // namespace crypto
