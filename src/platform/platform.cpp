#include "platform.hpp"
#include <signal.h>
#include <unistd.h>

namespace platform {

static sigset_t termination_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

void block_termination_signals() {
    sigset_t set = termination_set();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int wait_for_termination_signal() {
    sigset_t set = termination_set();
    int sig = 0;
    if (sigwait(&set, &sig) != 0) return -1;
    return sig;
}

void raise_termination() {
    kill(getpid(), SIGTERM);
}

} // namespace platform
