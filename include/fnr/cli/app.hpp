#pragma once

#include <fnr/config.hpp>
#include <fnr/core/display.hpp>
#include <fnr/core/matcher.hpp>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace fnr {

enum ExitCode {
    EXIT_OK = 0,       // includes "no matches"
    EXIT_FATAL = 1,    // bad pattern, bad config, missing base directory
    EXIT_PARTIAL = 2   // at least one rename failed or was rejected
};

// Everything the command line decided, before config files are merged in
struct RunOptions {
    PatternConfig pattern;
    std::filesystem::path base_dir = ".";
    bool dry_run = false;

    // Explicit --config file; replaces the global layer when set
    std::string config_path;
    bool use_global_config = true;
    bool use_project_config = true;

    // Color when neither the command line nor a config file says otherwise
    bool default_color = false;

    // Values given as flags; the top configuration layer
    Config cli;
};

// Run one search or rename. `decisions` overrides the terminal prompt in
// interactive mode.
int run(const RunOptions& opts, std::ostream& out, std::ostream& err,
        DecisionSource* decisions = nullptr);

} // namespace fnr
