#pragma once

namespace cmdgate::cli {

/// Exit codes: 0 on success, 1 on a runtime error, 2 on a usage error.
int run_cli(int argc, char **argv);

} // namespace cmdgate::cli
