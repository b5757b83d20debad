// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/bytes.h"

namespace base {

bool operator==(Bytes a, Bytes b) noexcept {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return ::memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace base
