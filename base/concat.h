// base/concat.h - Concatenate strings and stringable objects
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_CONCAT_H
#define BASE_CONCAT_H

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace base {
namespace internal {

// Detects types providing |void append_to(std::string*) const|.
template <typename T>
struct has_append_to {
 private:
  template <typename U>
  static auto check(int) -> decltype(
      std::declval<const U&>().append_to(std::declval<std::string*>()),
      std::true_type());
  template <typename U>
  static std::false_type check(...);

 public:
  static constexpr bool value = decltype(check<T>(0))::value;
};

template <typename T>
typename std::enable_if<has_append_to<T>::value>::type append_one(
    std::string* out, const T& arg) {
  arg.append_to(out);
}

template <typename T>
typename std::enable_if<!has_append_to<T>::value>::type append_one(
    std::string* out, const T& arg) {
  std::ostringstream os;
  os << arg;
  out->append(os.str());
}

inline void append_one(std::string* out, const std::string& arg) {
  out->append(arg);
}
inline void append_one(std::string* out, const char* arg) {
  if (arg) out->append(arg);
}
inline void append_one(std::string* out, char arg) { out->push_back(arg); }

// uint8_t would otherwise stringify as a raw character.
inline void append_one(std::string* out, unsigned char arg) {
  out->append(std::to_string(static_cast<unsigned int>(arg)));
}

}  // namespace internal

// concat_to appends the stringified form of each of |args| to |out|.
template <typename... Args>
void concat_to(std::string* out, const Args&... args) {
  int dummy[] = {0, (internal::append_one(out, args), 0)...};
  (void)dummy;
}

// concat returns the concatenated stringified forms of |args|.
//
// Typical usage:
//    std::string msg = base::concat("key length ", n, " is not valid");
//
template <typename... Args>
std::string concat(const Args&... args) {
  std::string out;
  concat_to(&out, args...);
  return out;
}

}  // namespace base

#endif  // BASE_CONCAT_H
