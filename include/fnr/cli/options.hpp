#pragma once

#include <fnr/cli/app.hpp>
#include <optional>

namespace fnr {

constexpr const char* FNR_VERSION = "0.3.0";

// Fill `opts` from argv. Returns an exit code when the program should stop
// right away (--help, --version, bad arguments), nullopt to go on.
std::optional<int> parse_command_line(int argc, char** argv, RunOptions& opts);

} // namespace fnr
