#pragma once

#include "config.hpp"

namespace emberkv {

// Runs the accept/dispatch loop until shutdown is requested. Returns the
// process exit status: 0 after a clean shutdown, 1 on a startup failure.
int run_server(const ServerConfig& config);

// Async-signal-safe.
void request_shutdown();
bool shutdown_requested();
void reset_shutdown_request();

} // namespace emberkv
