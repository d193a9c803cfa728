#pragma once

#include <signal.h>

namespace lxcforge::common {

/// Turns SIGINT and SIGTERM into a flag for as long as it is in scope, so a run can unwind
/// and clean up instead of being killed. Blocking system calls return EINTR when the signal
/// arrives (no SA_RESTART). The previous handlers are restored on destruction.
class InterruptGuard {
public:
  InterruptGuard();
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard &) = delete;
  InterruptGuard &operator=(const InterruptGuard &) = delete;

private:
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
};

/// True once SIGINT or SIGTERM arrived under an InterruptGuard.
[[nodiscard]] bool interrupted() noexcept;

} // namespace lxcforge::common
