#pragma once

namespace sos::cli {

/// Entry point for the `sos` binary. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace sos::cli
