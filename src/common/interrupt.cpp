#include "lxcforge/common/interrupt.hpp"

namespace lxcforge::common {

namespace {

volatile sig_atomic_t g_interrupted = 0;

void on_interrupt(int /*signal*/) { g_interrupted = 1; }

} // namespace

InterruptGuard::InterruptGuard() {
  g_interrupted = 0;
  struct sigaction action {};
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  (void)sigaction(SIGINT, &action, &old_int_);
  (void)sigaction(SIGTERM, &action, &old_term_);
}

InterruptGuard::~InterruptGuard() {
  (void)sigaction(SIGINT, &old_int_, nullptr);
  (void)sigaction(SIGTERM, &old_term_, nullptr);
  g_interrupted = 0;
}

bool interrupted() noexcept { return g_interrupted != 0; }

} // namespace lxcforge::common
