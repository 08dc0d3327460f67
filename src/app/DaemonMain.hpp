#pragma once

namespace rf::app
{

// Runs the reelfetch daemon (engine session, download orchestrator and
// schedule supervisor) until SIGINT/SIGTERM. Returns the process exit code.
int daemon_main(int argc, char *argv[]);

} // namespace rf::app
