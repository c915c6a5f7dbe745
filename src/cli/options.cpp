#include <fnr/cli/options.hpp>
#include <fnr/log.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fnr {

std::optional<int> parse_command_line(int argc, char** argv, RunOptions& opts) {
    CLI::App app{"Fast file and directory name search and rename tool", "fnr"};
    app.footer(
        "A second positional argument switches to rename mode; any further\n"
        "arguments are glob filters ('*.rs', '**/*.{h,cpp}', '!target/**').");
    app.set_version_flag("-V,--version", FNR_VERSION);

    std::string replacement;
    std::vector<std::string> positional_globs;
    std::vector<std::string> option_globs;
    std::string type_name;
    std::string log_level;
    size_t max_depth = 0;
    size_t min_depth = 0;
    std::string base_dir = ".";

    bool regex = false, dry_run = false, no_interactive = false, no_recursive = false;
    bool case_sensitive = false, hidden = false, no_color = false;
    bool no_symlink = false, no_skip_gitignore = false;

    app.add_option("pattern", opts.pattern.pattern,
        "Pattern to search for (or old pattern for rename)")->required();
    auto* replacement_opt = app.add_option("replacement", replacement,
        "New pattern for rename (if provided, enables rename mode)");
    app.add_option("globs", positional_globs,
        "Glob patterns to match (e.g., '*.rs', '**/*.{h,cpp}', '!target/**')");
    app.add_option("-g,--glob", option_globs,
        "Glob pattern to match; repeatable, usable in search mode")
        ->allow_extra_args(false)->type_name("GLOB");

    app.add_option("-d,--base-dir", base_dir, "Base directory to search from")
        ->default_str(".");
    app.add_flag("-r,--regex", regex, "Enable regular expression matching");
    auto* type_opt = app.add_option("-t,--type", type_name, "Filter by file type")
        ->check(CLI::IsMember({"file", "dir", "both", "f", "d", "b"}))
        ->default_str("both");
    app.add_flag("--dry-run", dry_run, "Show what would be renamed without executing");
    app.add_flag("--no-interactive", no_interactive, "Apply all changes without prompts");
    app.add_flag("--no-recursive", no_recursive, "Don't search subdirectories");
    app.add_flag("--case-sensitive", case_sensitive, "Case-sensitive matching");
    app.add_flag("--hidden", hidden, "Include hidden files and directories");
    app.add_flag("--no-color", no_color, "Disable colored output");
    app.add_flag("--no-symlink", no_symlink, "Disable symbolic link follow");
    app.add_flag("--no-skip-gitignore", no_skip_gitignore, "Disable .gitignore skip");
    auto* max_opt = app.add_option("--max-depth", max_depth, "Maximum depth to search");
    auto* min_opt = app.add_option("--min-depth", min_depth, "Minimum depth to search");
    app.add_option("--config", opts.config_path,
        "Read settings from FILE instead of ~/.fnr/config.toml")
        ->check(CLI::ExistingFile)->type_name("FILE");
    auto* level_opt = app.add_option("--log-level", log_level,
        "Log verbosity (trace, debug, info, warn, error, off)")->type_name("LEVEL");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    opts.base_dir = base_dir;
    opts.dry_run = dry_run;
    if (replacement_opt->count() > 0) {
        opts.pattern.replacement = replacement;
    }

    // Flags only set the values they name; config files fill the rest
    Config& cli = opts.cli;
    if (regex) cli.regex = true;
    if (case_sensitive) cli.case_sensitive = true;
    if (hidden) cli.hidden = true;
    if (no_symlink) cli.follow_symlinks = false;
    if (no_skip_gitignore) cli.respect_ignore = false;
    if (no_recursive) cli.recursive = false;
    if (no_interactive) cli.interactive = false;
    if (no_color) cli.color = false;
    if (max_opt->count() > 0) cli.max_depth = max_depth;
    if (min_opt->count() > 0) cli.min_depth = min_depth;
    if (type_opt->count() > 0) {
        cli.type = parse_entry_type(type_name).value_or(EntryType::Both);
    }

    std::vector<std::string> globs = positional_globs;
    globs.insert(globs.end(), option_globs.begin(), option_globs.end());
    if (!globs.empty()) cli.globs = std::move(globs);

    if (level_opt->count() > 0) {
        auto lvl = log::parse_level(log_level);
        if (lvl.is_err()) {
            std::cerr << lvl.error().format() << "\n";
            return static_cast<int>(EXIT_FATAL);
        }
        cli.log_level = log_level;
    }

    const char* no_color_env = std::getenv("NO_COLOR");
    bool env_forbids_color = no_color_env && no_color_env[0] != '\0';
    opts.default_color = !env_forbids_color && isatty(STDOUT_FILENO);
    return std::nullopt;
}

} // namespace fnr
