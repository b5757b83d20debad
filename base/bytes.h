// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_BYTES_H
#define BASE_BYTES_H

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace base {

template <bool Mutable>
class BasicBytes;

// Represents a view into an immutable byte buffer.
//
// NOTE: Bytes does not own the memory it points to.
//       Use std::vector<uint8_t> or alternatives if you need memory to persist.
//       In particular, Bytes is rarely appropriate as an object member.
//
using Bytes = BasicBytes<false>;

// Represents a view into a mutable byte buffer.
//
// NOTE: MutableBytes does not own the memory it points to.
//       Use std::vector<uint8_t> or alternatives if you need memory to persist.
//       In particular, MutableBytes is rarely appropriate as an object member.
//
using MutableBytes = BasicBytes<true>;

template <bool Mutable>
class BasicBytes {
 private:
  template <bool B, typename T = void>
  using If = typename std::enable_if<B, T>::type;

  template <bool B, typename T, typename U>
  using Cond = typename std::conditional<B, T, U>::type;

 public:
  using value_type = uint8_t;
  using size_type = std::size_t;
  using pointer = Cond<Mutable, uint8_t*, const uint8_t*>;
  using reference = Cond<Mutable, uint8_t&, const uint8_t&>;
  using iterator = pointer;
  using char_pointer = Cond<Mutable, char*, const char*>;

  static constexpr size_type npos = SIZE_MAX;

  constexpr BasicBytes() noexcept : data_(nullptr), size_(0) {}
  constexpr BasicBytes(pointer ptr, size_type len) noexcept : data_(ptr),
                                                              size_(len) {}
  BasicBytes(char_pointer ptr, size_type len) noexcept
      : data_(reinterpret_cast<pointer>(ptr)),
        size_(len) {}

  BasicBytes(std::vector<uint8_t>& vec) noexcept : data_(vec.data()),
                                                   size_(vec.size()) {}

  template <bool M = Mutable, typename = If<!M>>
  BasicBytes(const std::vector<uint8_t>& vec) noexcept : data_(vec.data()),
                                                         size_(vec.size()) {}

  template <std::size_t N>
  BasicBytes(std::array<uint8_t, N>& arr) noexcept : data_(arr.data()),
                                                     size_(N) {}

  template <std::size_t N, bool M = Mutable, typename = If<!M>>
  BasicBytes(const std::array<uint8_t, N>& arr) noexcept : data_(arr.data()),
                                                           size_(N) {}

  // MutableBytes converts implicitly to Bytes, but not vice versa.
  template <bool M = Mutable, typename = If<!M>>
  BasicBytes(const BasicBytes<true>& other) noexcept : data_(other.data()),
                                                      size_(other.size()) {}

  constexpr BasicBytes(const BasicBytes&) noexcept = default;
  BasicBytes& operator=(const BasicBytes&) noexcept = default;

  constexpr pointer data() const noexcept { return data_; }
  constexpr size_type size() const noexcept { return size_; }
  constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr iterator begin() const noexcept { return data_; }
  constexpr iterator end() const noexcept { return data_ + size_; }

  constexpr reference operator[](size_type index) const noexcept {
    return data_[index];
  }

  // Returns the subrange [pos, pos+len), clamped to the view.
  constexpr BasicBytes substring(size_type pos,
                                 size_type len = npos) const noexcept {
    return (pos >= size_)
               ? BasicBytes(data_ + size_, 0)
               : BasicBytes(data_ + pos,
                            (len > size_ - pos) ? (size_ - pos) : len);
  }

  void remove_prefix(size_type n) noexcept {
    if (n > size_) n = size_;
    data_ += n;
    size_ -= n;
  }

  std::vector<uint8_t> as_vector() const {
    return std::vector<uint8_t>(data_, data_ + size_);
  }

  std::string as_string() const {
    return std::string(reinterpret_cast<const char*>(data_), size_);
  }

 private:
  pointer data_;
  size_type size_;
};

template <bool Mutable>
constexpr std::size_t BasicBytes<Mutable>::npos;

bool operator==(Bytes a, Bytes b) noexcept;
inline bool operator!=(Bytes a, Bytes b) noexcept { return !(a == b); }

}  // namespace base

#endif  // BASE_BYTES_H
