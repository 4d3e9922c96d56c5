#include "engram/cli/commands.hpp"

int main(int argc, char **argv) { return engram::cli::run_cli(argc, argv); }
