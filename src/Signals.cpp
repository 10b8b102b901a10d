#include "duct/Signals.hpp"

#include <csignal>
#include <ctime>

#include <pthread.h>
#include <spawn.h>

namespace duct {

int setChildSignals(posix_spawnattr_t* attrs) {
  sigset_t mask;
  sigemptyset(&mask);
  if (int err = posix_spawnattr_setsigmask(attrs, &mask)) {
    return err;
  }

  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGINT);
  if (int err = posix_spawnattr_setsigdefault(attrs, &defaults)) {
    return err;
  }

  short flags = POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;
  return posix_spawnattr_setflags(attrs, flags);
}

int blockSigpipeOnThisThread() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  return pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

void clearPendingSigpipe() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);

  sigset_t pending;
  sigemptyset(&pending);
  if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
    timespec zero{};
    // EAGAIN only if another thread consumed it first
    [[maybe_unused]] int consumed = sigtimedwait(&set, nullptr, &zero);
  }
}

} // namespace duct
