// SPDX-License-Identifier: MIT
#include "crates/interrupt.hh"

#include <signal.h>

#include <csignal>

namespace crates {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void OnInterrupt(int signo) {
  if (g_interrupted) {
    signal(signo, SIG_DFL);
    raise(signo);
    return;
  }

  g_interrupted = 1;
}

}  // namespace

void InstallInterruptHandler() {
  struct sigaction sa {};
  sa.sa_handler = &OnInterrupt;
  sigemptyset(&sa.sa_mask);

  // No SA_RESTART: blocking calls should return EINTR so that callers get a
  // chance to look at the flag.
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool IsInterrupted() { return g_interrupted != 0; }

void ResetInterrupted() { g_interrupted = 0; }

}  // namespace crates
