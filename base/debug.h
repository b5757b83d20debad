// base/debug.h - Provides a friendly way to check the global debugging mode
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_DEBUG_H
#define BASE_DEBUG_H

namespace base {

// Returns true if debug mode is on.  In debug mode, DFATAL log entries and
// failed CHECKs terminate the process.  Defaults to on unless NDEBUG is set.
bool debug() noexcept;

// Turns debug mode on or off.  aestool --debug calls this at startup.
void set_debug(bool value) noexcept;

// ScopedDebug sets the debug mode for its lifetime, then restores the
// previous mode.
class ScopedDebug {
 public:
  explicit ScopedDebug(bool value) noexcept;
  ~ScopedDebug() noexcept;

  ScopedDebug(const ScopedDebug&) = delete;
  ScopedDebug& operator=(const ScopedDebug&) = delete;

 private:
  bool saved_;
};

}  // namespace base

#endif  // BASE_DEBUG_H
