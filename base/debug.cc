// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/debug.h"

#include <atomic>

namespace base {

#ifdef NDEBUG
static std::atomic_bool g_debug(false);
#else
static std::atomic_bool g_debug(true);
#endif

bool debug() noexcept { return g_debug.load(std::memory_order_relaxed); }

void set_debug(bool value) noexcept {
  g_debug.store(value, std::memory_order_relaxed);
}

ScopedDebug::ScopedDebug(bool value) noexcept
    : saved_(g_debug.exchange(value, std::memory_order_relaxed)) {}

ScopedDebug::~ScopedDebug() noexcept {
  g_debug.store(saved_, std::memory_order_relaxed);
}

}  // namespace base
