#pragma once

#include <fnr/result.hpp>
#include <fnr/core/collector.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fnr {

// Layered configuration: global > project > command line.
// Later layers override earlier ones, key by key; unset keys fall through.
struct Config {
    // [search]
    std::optional<bool> regex;
    std::optional<bool> case_sensitive;
    std::optional<bool> hidden;
    std::optional<bool> follow_symlinks;
    std::optional<bool> respect_ignore;
    std::optional<bool> recursive;
    std::optional<size_t> max_depth;
    std::optional<size_t> min_depth;
    std::optional<EntryType> type;
    std::optional<std::vector<std::string>> globs;

    // [rename]
    std::optional<bool> interactive;

    // [output]
    std::optional<bool> color;
    std::optional<std::string> log_level;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Like load(), but a missing file is not an error
    static Result<std::optional<Config>> load_if_present(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> cli
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const Config& cli);

    // Copy every set value into the core's option structs
    void apply(WalkOptions& walk, FilterConfig& filter, PatternConfig& pattern) const;
};

// ~/.fnr/config.toml, or "" when no home directory is known
std::string global_config_path();

// <base_dir>/.fnr.toml
std::string project_config_path(const std::filesystem::path& base_dir);

} // namespace fnr
