#pragma once

#include <spawn.h>

namespace duct {

// Empty signal mask and default SIGPIPE/SIGINT dispositions for spawned
// children. Returns 0 or an errno value.
int setChildSignals(posix_spawnattr_t* attrs);

// Writes to a pipe with no reader fail with EPIPE on this thread instead of
// raising SIGPIPE for the process. Returns 0 or an errno value.
int blockSigpipeOnThisThread();

// Drops a SIGPIPE left pending on this thread by a failed write.
void clearPendingSigpipe();

} // namespace duct
