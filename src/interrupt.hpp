#pragma once

namespace qwstream {

// Route SIGINT and SIGTERM to a process-wide flag and ignore SIGPIPE.
// The handlers are installed without SA_RESTART, so a blocking terminal
// read (the interactive prompt) fails with EINTR instead of resuming.
// Throws std::runtime_error if a handler cannot be installed.
void install_interrupt_handlers();

bool interrupted();
void clear_interrupt();

} // namespace qwstream
