#pragma once

namespace platform {

// Block SIGINT, SIGTERM and SIGHUP in the calling thread. Call from main()
// before any thread is started so every thread inherits the mask.
void block_termination_signals();

// Wait until one of the blocked termination signals arrives and return it.
int wait_for_termination_signal();

// Deliver SIGTERM to this process (wakes wait_for_termination_signal()).
void raise_termination();

} // namespace platform
