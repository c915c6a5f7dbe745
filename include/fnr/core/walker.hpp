#pragma once

#include <fnr/result.hpp>
#include <fnr/core/ignore.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fnr {

struct WalkOptions {
    std::filesystem::path root = ".";
    bool recursive = true;
    // Depth 0 is the root itself, its children are depth 1
    std::optional<size_t> max_depth;
    std::optional<size_t> min_depth;
    bool include_hidden = false;
    bool follow_symlinks = true;
    bool honor_ignore = true;

    // Effective bounds after applying `recursive`
    size_t effective_max_depth() const;
    size_t effective_min_depth() const;
};

struct WalkEntry {
    std::filesystem::path path;   // root / rel_path
    std::string rel_path;         // forward slashes, relative to root
    size_t depth = 0;
    bool is_dir = false;
    bool is_symlink = false;
};

// Depth-first traversal yielding entries lazily. Siblings are visited in
// byte-wise name order and a directory is yielded before its contents.
// Per-entry problems become warnings and never stop the walk.
class Walker {
public:
    // Fails with IO when the root is missing or not a directory
    static Result<Walker> open(WalkOptions opts);

    std::optional<WalkEntry> next();

    const std::vector<FnrError>& warnings() const { return warnings_; }

private:
    struct Frame {
        std::filesystem::path dir;
        std::string rel;
        size_t depth = 0;
        std::filesystem::path canonical;
        std::vector<std::filesystem::directory_entry> children;
        size_t index = 0;
        IgnoreFile ignore;
    };

    explicit Walker(WalkOptions opts) : opts_(std::move(opts)) {}

    // Read a directory's children and ignore files onto the stack
    void push_dir(const std::filesystem::path& dir, const std::string& rel,
                  size_t depth, const std::filesystem::path& canonical);

    bool is_ignored(const std::string& rel, bool is_dir) const;
    bool is_ancestor_dir(const std::filesystem::path& canonical) const;
    void warn(const std::string& message, const std::filesystem::path& path);

    WalkOptions opts_;
    std::vector<Frame> stack_;
    std::vector<FnrError> warnings_;
};

} // namespace fnr
