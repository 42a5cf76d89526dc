#include "skillreg/cli/commands.hpp"

int main(int argc, char **argv) { return skillreg::cli::run_cli(argc, argv); }
