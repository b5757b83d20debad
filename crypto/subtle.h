// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef CRYPTO_SUBTLE_H
#define CRYPTO_SUBTLE_H

#include <cstdint>
#include <new>
#include <utility>

namespace crypto {
namespace subtle {

// Allocates whole pages of zeroed memory that are locked into RAM, if the
// process is permitted to lock memory.  Throws std::system_error if the
// pages cannot be mapped at all.
void* secure_allocate(std::size_t len);

// Zeroes and releases memory returned by |secure_allocate(len)|.
void secure_deallocate(void* ptr, std::size_t len) noexcept;

// SecureMemory owns a single T allocated with |secure_allocate|.
// Key material, such as an expanded AES key schedule, lives here so that it
// stays out of swap and is wiped when the owner goes away.
template <typename T>
class SecureMemory {
 public:
  template <typename... Args>
  explicit SecureMemory(Args&&... args)
      : pointer_(static_cast<T*>(secure_allocate(sizeof(T)))) {
    try {
      new (pointer_) T(std::forward<Args>(args)...);
    } catch (...) {
      secure_deallocate(pointer_, sizeof(T));
      throw;
    }
  }

  ~SecureMemory() noexcept {
    pointer_->~T();
    secure_deallocate(pointer_, sizeof(T));
  }

  SecureMemory(const SecureMemory&) = delete;
  SecureMemory(SecureMemory&&) = delete;
  SecureMemory& operator=(const SecureMemory&) = delete;
  SecureMemory& operator=(SecureMemory&&) = delete;

  T& operator*() const noexcept { return *pointer_; }
  T* operator->() const noexcept { return pointer_; }
  T* get() const noexcept { return pointer_; }

 private:
  T* pointer_;
};

}  // namespace subtle
}  // namespace crypto

#endif  // CRYPTO_SUBTLE_H
