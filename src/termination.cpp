#include "termination.h"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <tuple>

namespace {

std::atomic_int s_signals_seen{ 0 };

void signal_handler(int sig) {
  if (s_signals_seen.fetch_add(1) > 0) {
    // Restore cursor visibility and auto-wrap before exit
    std::ignore = write(STDERR_FILENO, "\x1b[?25h\x1b[?7h", 12);
    _exit(128 + sig);
  }

  constexpr char kMessage[]{ "\nInterrupt received; finishing in-flight operations "
                             "(interrupt again to exit immediately)\n" };
  std::ignore = write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
  strata::termination_cancellation().request();
}

}  // namespace

namespace strata {

cancellation &termination_cancellation() {
  static cancellation instance;
  return instance;
}

void termination_handler_install() {
  termination_cancellation();  // constructed before any signal can arrive

  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace strata
