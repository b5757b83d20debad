// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_CHARS_H
#define BASE_CHARS_H

#include <cstring>
#include <iosfwd>
#include <string>

#include <re2/stringpiece.h>

#include "base/bytes.h"

namespace base {

// Represents a view into an immutable character buffer.
//
// NOTE: Chars does not own the memory it points to.
//       In particular, Chars is rarely appropriate as an object member.
//
class Chars {
 public:
  using value_type = char;
  using size_type = std::size_t;
  using pointer = const char*;
  using iterator = const char*;

  static constexpr size_type npos = SIZE_MAX;

  constexpr Chars() noexcept : data_(nullptr), size_(0) {}
  constexpr Chars(const char* ptr, size_type len) noexcept : data_(ptr),
                                                             size_(len) {}
  Chars(const char* ptr) noexcept : data_(ptr),
                                    size_(ptr ? ::strlen(ptr) : 0) {}
  Chars(const std::string& str) noexcept : data_(str.data()),
                                           size_(str.size()) {}
  Chars(re2::StringPiece sp) noexcept : data_(sp.data()), size_(sp.size()) {}
  constexpr Chars(const Chars&) noexcept = default;
  Chars& operator=(const Chars&) noexcept = default;

  constexpr pointer data() const noexcept { return data_; }
  constexpr size_type size() const noexcept { return size_; }
  constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr iterator begin() const noexcept { return data_; }
  constexpr iterator end() const noexcept { return data_ + size_; }

  constexpr char operator[](size_type index) const noexcept {
    return data_[index];
  }

  constexpr Chars substring(size_type pos,
                            size_type len = npos) const noexcept {
    return (pos >= size_)
               ? Chars(data_ + size_, 0)
               : Chars(data_ + pos, (len > size_ - pos) ? (size_ - pos) : len);
  }

  bool has_prefix(Chars prefix) const noexcept {
    return size_ >= prefix.size_ &&
           (prefix.size_ == 0 ||
            ::memcmp(data_, prefix.data_, prefix.size_) == 0);
  }

  void remove_prefix(size_type n) noexcept {
    if (n > size_) n = size_;
    data_ += n;
    size_ -= n;
  }

  // Removes |prefix| if present.  Returns true iff it was removed.
  bool remove_prefix(Chars prefix) noexcept {
    if (!has_prefix(prefix)) return false;
    remove_prefix(prefix.size_);
    return true;
  }

  size_type find(char ch) const noexcept {
    for (size_type i = 0; i < size_; ++i) {
      if (data_[i] == ch) return i;
    }
    return npos;
  }

  Bytes bytes() const noexcept { return Bytes(data_, size_); }

  void append_to(std::string* out) const;
  std::string as_string() const { return std::string(data_, size_); }

  operator std::string() const { return as_string(); }

  operator re2::StringPiece() const noexcept {
    return re2::StringPiece(data_, size_);
  }

 private:
  const char* data_;
  size_type size_;
};

int compare(Chars a, Chars b) noexcept;

inline bool operator==(Chars a, Chars b) noexcept { return compare(a, b) == 0; }
inline bool operator!=(Chars a, Chars b) noexcept { return compare(a, b) != 0; }
inline bool operator<(Chars a, Chars b) noexcept { return compare(a, b) < 0; }
inline bool operator>(Chars a, Chars b) noexcept { return compare(a, b) > 0; }

std::ostream& operator<<(std::ostream& o, Chars chars);

}  // namespace base

#endif  // BASE_CHARS_H
