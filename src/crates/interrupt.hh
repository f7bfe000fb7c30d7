// SPDX-License-Identifier: MIT
#ifndef CRATES_INTERRUPT_HH_
#define CRATES_INTERRUPT_HH_

namespace crates {

// Installs handlers for SIGINT and SIGTERM. The first signal only sets a
// flag which long-running waits (file locks, network requests) poll so they
// can unwind and release what they hold. A second signal kills the process
// with the default action.
//
// Libraries never call this; it is up to the program.
void InstallInterruptHandler();

// Returns true once an interrupt has been received.
bool IsInterrupted();

void ResetInterrupted();

}  // namespace crates

#endif  // CRATES_INTERRUPT_HH_
