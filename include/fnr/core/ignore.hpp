#pragma once

#include <fnr/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fnr {

// Names of the per-directory ignore files honored by the walker
extern const char* const IGNORE_FILE_NAMES[2];

struct IgnoreRule {
    std::string pattern;
    bool negated = false;    // "!pattern" re-includes
    bool dir_only = false;   // "pattern/" only matches directories
    bool anchored = false;   // leading or inner '/' ties it to the file's directory
};

// Rules read from one gitignore-style file. Paths given to decide() are
// relative to the directory that holds the file.
class IgnoreFile {
public:
    static IgnoreFile parse(const std::string& text);
    static Result<IgnoreFile> load(const std::filesystem::path& path);

    // nullopt: no rule applies. true: ignored. false: re-included by '!'.
    // The last matching rule wins.
    std::optional<bool> decide(const std::string& rel_path, bool is_dir) const;

    bool empty() const { return rules_.empty(); }
    const std::vector<IgnoreRule>& rules() const { return rules_; }

    // Append another file's rules after this one's (later rules win)
    void append(const IgnoreFile& other);

private:
    std::vector<IgnoreRule> rules_;
};

} // namespace fnr
