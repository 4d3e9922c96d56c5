#pragma once

#include <string>
#include <vector>

namespace engram::cli {

[[nodiscard]] std::string version_string();

/// Entry point of the `engram` executable; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace engram::cli
