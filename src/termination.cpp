#include "termination.h"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <tuple>

namespace {

std::atomic<bool> s_stop_requested{ false };
static_assert(std::atomic<bool>::is_always_lock_free);

void signal_handler(int sig) {
  if (s_stop_requested.exchange(true)) { _exit(128 + sig); }

  char const msg[]{ "\nStopping after in-flight units finish; signal again to abort\n" };
  std::ignore = write(STDERR_FILENO, msg, sizeof msg - 1);
}

}  // namespace

namespace harvest {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool termination_requested() { return s_stop_requested.load(); }

void termination_request() { s_stop_requested = true; }

void termination_reset() { s_stop_requested = false; }

}  // namespace harvest
