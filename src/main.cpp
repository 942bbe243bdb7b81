#include "cmdgate/cli/commands.hpp"

int main(int argc, char **argv) { return cmdgate::cli::run_cli(argc, argv); }
