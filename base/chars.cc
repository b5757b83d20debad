// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/chars.h"

#include <ostream>

namespace base {

constexpr std::size_t Chars::npos;

void Chars::append_to(std::string* out) const {
  if (size_ != 0) out->append(data_, size_);
}

int compare(Chars a, Chars b) noexcept {
  std::size_t n = (a.size() < b.size()) ? a.size() : b.size();
  int cmp = (n == 0) ? 0 : ::memcmp(a.data(), b.data(), n);
  if (cmp != 0) return cmp;
  if (a.size() < b.size()) return -1;
  if (a.size() > b.size()) return 1;
  return 0;
}

std::ostream& operator<<(std::ostream& o, Chars chars) {
  return o.write(chars.data(), chars.size());
}

}  // namespace base
