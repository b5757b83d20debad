// encoding/base64.h - Encode/Decode helpers for base-64 data
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef ENCODING_BASE64_H
#define ENCODING_BASE64_H

#include <string>
#include <vector>

#include "base/bytes.h"
#include "base/chars.h"
#include "base/result.h"

namespace encoding {

struct Base64 {
  const char* charset;

  constexpr Base64(const char* cs) noexcept : charset(cs) {}
};

// 64 digits, then the pad character.
constexpr char B64_STANDARD_CHARSET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";

constexpr Base64 BASE64 = {B64_STANDARD_CHARSET};

// Returns the number of characters needed to encode a |len|-byte input.
std::size_t encoded_length(Base64 b64, std::size_t len) noexcept;

// Reads the bytes in |src|, encodes them as padded base-64, and returns the
// resulting characters as a std::string.
std::string encode(Base64 b64, base::Bytes src);

inline std::string encode(Base64 b64, base::Chars src) {
  return encode(b64, src.bytes());
}

// Returns the largest number of bytes a |len|-char base-64 input can decode to.
std::size_t decoded_length(Base64 b64, std::size_t len) noexcept;

// Reads the characters in |src|, decodes them as padded base-64, and
// replaces the contents of |out| with the resulting bytes.
//
// Whitespace, including line breaks, is ignored anywhere.  The remaining
// digits must form whole 4-character groups; "=" may only pad the last
// one.  Anything else is an INVALID_ARGUMENT failure, in which case |out|
// is left untouched.
//
base::Result decode(Base64 b64, std::vector<uint8_t>* out, base::Chars src);

}  // namespace encoding

#endif  // ENCODING_BASE64_H
