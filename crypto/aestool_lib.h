// crypto/aestool_lib.h - Command implementation for the aestool binary
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_AESTOOL_LIB_H
#define CRYPTO_AESTOOL_LIB_H

#include <cstdint>
#include <string>
#include <vector>

#include "base/bytes.h"
#include "base/chars.h"
#include "base/result.h"

namespace crypto {
namespace aestool {

static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FAILED = 1;
static constexpr int EXIT_USAGE = 2;

// Text form of the ciphertext side: the output of "encrypt" and the input of
// "decrypt".  Plaintext is always raw bytes.
enum class Format : uint8_t {
  raw = 0,
  hex = 1,
  base64 = 2,
};

base::Result parse_format(Format* out, base::Chars name);

// Decodes a --key value.  "hex:<digits>" is base-16; anything else is taken
// literally, byte for byte.
base::Result decode_key(std::vector<uint8_t>* out, base::Chars text);

// Encrypts or decrypts |in| with the named "<cipher>+<mode>" and |key|,
// converting the ciphertext side according to |format|.  Encoded output ends
// with a newline.  Whitespace in encoded input is ignored.
base::Result transform(std::string* out, base::Chars cipher, base::Bytes key,
                       Format format, bool do_encrypt, base::Bytes in);

// Runs the tool.  Returns EXIT_OK or EXIT_FAILED; usage errors exit the
// process with EXIT_USAGE.
int run(int argc, const char* const* argv);

}  // namespace aestool
}  // namespace crypto

#endif  // CRYPTO_AESTOOL_LIB_H
