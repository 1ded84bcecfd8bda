#include "zbench/core/interrupt.hpp"

#include <csignal>

#include <signal.h>

namespace zbench {
namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt_signal(int) { g_interrupted = 1; }

}  // namespace

bool install_interrupt_handlers() noexcept {
  struct sigaction sa{};
  sa.sa_handler = on_interrupt_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (::sigaction(SIGINT, &sa, nullptr) != 0) {
    return false;
  }
  return ::sigaction(SIGTERM, &sa, nullptr) == 0;
}

bool interrupt_requested() noexcept { return g_interrupted != 0; }

void clear_interrupt() noexcept { g_interrupted = 0; }

}  // namespace zbench
