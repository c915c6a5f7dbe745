#include <fnr/config.hpp>
#include <fnr/log.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fnr {

template<typename T>
static Status read_key(const toml::table& tbl, const std::string& section,
                       const char* key, const char* type_name, std::optional<T>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.template value<T>();
    if (!v) {
        return FnrError{FnrError::Config,
            "[" + section + "] " + key + " must be a " + type_name};
    }
    out = *v;
    return ok_status();
}

static Status read_depth(const toml::table& tbl, const char* key,
                         std::optional<size_t>& out) {
    std::optional<int64_t> raw;
    FNR_TRY(read_key(tbl, "search", key, "integer", raw));
    if (!raw.has_value()) return ok_status();
    if (raw.value() < 0) {
        return FnrError{FnrError::Config,
            std::string("[search] ") + key + " must not be negative"};
    }
    out = static_cast<size_t>(raw.value());
    return ok_status();
}

static void warn_unknown_keys(const toml::table& tbl, const std::string& section,
                              std::initializer_list<const char*> known) {
    for (const auto& [key, val] : tbl) {
        (void)val;
        bool found = false;
        for (const char* k : known) {
            if (key.str() == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            log::warn("config: unknown key [%s] %s", section.c_str(),
                      std::string(key.str()).c_str());
        }
    }
}

static Status parse_search(const toml::table& search, Config& cfg) {
    warn_unknown_keys(search, "search", {"regex", "case-sensitive", "hidden",
        "follow-symlinks", "respect-ignore", "recursive", "max-depth",
        "min-depth", "type", "globs"});

    FNR_TRY(read_key(search, "search", "regex", "boolean", cfg.regex));
    FNR_TRY(read_key(search, "search", "case-sensitive", "boolean", cfg.case_sensitive));
    FNR_TRY(read_key(search, "search", "hidden", "boolean", cfg.hidden));
    FNR_TRY(read_key(search, "search", "follow-symlinks", "boolean", cfg.follow_symlinks));
    FNR_TRY(read_key(search, "search", "respect-ignore", "boolean", cfg.respect_ignore));
    FNR_TRY(read_key(search, "search", "recursive", "boolean", cfg.recursive));
    FNR_TRY(read_depth(search, "max-depth", cfg.max_depth));
    FNR_TRY(read_depth(search, "min-depth", cfg.min_depth));

    std::optional<std::string> type;
    FNR_TRY(read_key(search, "search", "type", "string", type));
    if (type.has_value()) {
        auto parsed = parse_entry_type(type.value());
        if (parsed.is_err()) {
            return FnrError{FnrError::Config,
                "[search] type: " + parsed.error().message, parsed.error().hint};
        }
        cfg.type = parsed.value();
    }

    if (auto node = search["globs"]) {
        auto arr = node.as_array();
        if (!arr) {
            return FnrError{FnrError::Config, "[search] globs must be an array of strings"};
        }
        std::vector<std::string> globs;
        for (const auto& el : *arr) {
            auto s = el.value<std::string>();
            if (!s) {
                return FnrError{FnrError::Config, "[search] globs must be an array of strings"};
            }
            globs.push_back(*s);
        }
        cfg.globs = std::move(globs);
    }
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FnrError{FnrError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    if (auto node = doc["search"]) {
        auto search = node.as_table();
        if (!search) return FnrError{FnrError::Config, "[search] must be a table"};
        FNR_TRY(parse_search(*search, cfg));
    }

    if (auto node = doc["rename"]) {
        auto rename = node.as_table();
        if (!rename) return FnrError{FnrError::Config, "[rename] must be a table"};
        warn_unknown_keys(*rename, "rename", {"interactive"});
        FNR_TRY(read_key(*rename, "rename", "interactive", "boolean", cfg.interactive));
    }

    if (auto node = doc["output"]) {
        auto output = node.as_table();
        if (!output) return FnrError{FnrError::Config, "[output] must be a table"};
        warn_unknown_keys(*output, "output", {"color", "log-level"});
        FNR_TRY(read_key(*output, "output", "color", "boolean", cfg.color));
        FNR_TRY(read_key(*output, "output", "log-level", "string", cfg.log_level));
        if (cfg.log_level.has_value()) {
            auto lvl = log::parse_level(cfg.log_level.value());
            if (lvl.is_err()) {
                return FnrError{FnrError::Config,
                    "[output] log-level: " + lvl.error().message, lvl.error().hint};
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FnrError{FnrError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.path = path;
        return err;
    }
    log::debug("loaded config %s", path.c_str());
    return cfg;
}

Result<std::optional<Config>> Config::load_if_present(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    FNR_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

template<typename T>
static void override_with(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

void Config::merge(const Config& other) {
    override_with(regex, other.regex);
    override_with(case_sensitive, other.case_sensitive);
    override_with(hidden, other.hidden);
    override_with(follow_symlinks, other.follow_symlinks);
    override_with(respect_ignore, other.respect_ignore);
    override_with(recursive, other.recursive);
    override_with(max_depth, other.max_depth);
    override_with(min_depth, other.min_depth);
    override_with(type, other.type);
    override_with(globs, other.globs);
    override_with(interactive, other.interactive);
    override_with(color, other.color);
    override_with(log_level, other.log_level);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const Config& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    result.merge(cli);
    return result;
}

void Config::apply(WalkOptions& walk, FilterConfig& filter, PatternConfig& pattern) const {
    if (regex) pattern.regex = *regex;
    if (case_sensitive) pattern.case_sensitive = *case_sensitive;
    if (hidden) walk.include_hidden = *hidden;
    if (follow_symlinks) walk.follow_symlinks = *follow_symlinks;
    if (respect_ignore) walk.honor_ignore = *respect_ignore;
    if (recursive) walk.recursive = *recursive;
    if (max_depth) walk.max_depth = max_depth;
    if (min_depth) walk.min_depth = min_depth;
    if (type) filter.type = *type;
    if (globs) filter.globs = *globs;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.fnr/config.toml";
}

std::string project_config_path(const std::filesystem::path& base_dir) {
    return (base_dir / ".fnr.toml").string();
}

} // namespace fnr
