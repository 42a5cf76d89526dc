#pragma once

namespace skillreg::cli {

/// Entry point of the `skillreg` executable. Returns the process exit status.
int run_cli(int argc, char **argv);

} // namespace skillreg::cli
