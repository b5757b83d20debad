// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/subtle.h"

#include <sys/mman.h>
#include <strings.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include "base/logging.h"
#include "base/result.h"

namespace crypto {
namespace subtle {

static std::size_t page_size() { return ::sysconf(_SC_PAGE_SIZE); }

static std::size_t pad_to_page_size(std::size_t len) {
  std::size_t x = page_size();
  std::size_t y = (x - 1);
  if (len > SIZE_MAX - y) throw std::overflow_error("allocation overflow");
  return (len + y) & ~y;
}

void* secure_allocate(std::size_t len) {
  len = pad_to_page_size(len);
  void* ptr = ::mmap(nullptr, len, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  if (ptr == MAP_FAILED) {
    int err_no = errno;
    throw std::system_error(err_no, std::system_category(), "mmap(2)");
  }
  int rc = ::mlock(ptr, len);
  if (rc != 0) {
    // Over RLIMIT_MEMLOCK: continue unlocked.  Release still wipes the pages.
    int err_no = errno;
    LOG_EVERY_N(WARN, 64) << base::Result::from_errno(err_no, "mlock(2)");
  }
  return ptr;
}

void secure_deallocate(void* ptr, std::size_t len) noexcept {
  len = pad_to_page_size(len);
  ::bzero(ptr, len);
  int rc = ::munmap(ptr, len);
  if (rc != 0) {
    int err_no = errno;
    LOG(DFATAL) << base::Result::from_errno(err_no, "munmap(2)");
  }
}

}  // namespace subtle
}  // namespace crypto
