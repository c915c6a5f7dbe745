#include <fnr/core/walker.hpp>
#include <fnr/log.hpp>
#include <algorithm>
#include <limits>

namespace fnr {

namespace fs = std::filesystem;

size_t WalkOptions::effective_max_depth() const {
    size_t limit = recursive ? std::numeric_limits<size_t>::max() : 1;
    if (max_depth.has_value()) limit = std::min(limit, max_depth.value());
    return limit;
}

size_t WalkOptions::effective_min_depth() const {
    // The root itself is never yielded
    return std::max<size_t>(1, min_depth.value_or(1));
}

Result<Walker> Walker::open(WalkOptions opts) {
    std::error_code ec;
    auto st = fs::status(opts.root, ec);
    if (ec || !fs::exists(st)) {
        return FnrError{FnrError::IO,
            "base directory does not exist: " + opts.root.string(),
            "pass an existing directory with --base-dir"};
    }
    if (!fs::is_directory(st)) {
        return FnrError{FnrError::IO,
            "base path is not a directory: " + opts.root.string()};
    }

    auto canonical = fs::canonical(opts.root, ec);
    if (ec) {
        return FnrError{FnrError::IO,
            "cannot resolve base directory " + opts.root.string() + ": " + ec.message()};
    }

    Walker walker(std::move(opts));
    if (walker.opts_.effective_max_depth() > 0) {
        walker.push_dir(walker.opts_.root, "", 0, canonical);
    }
    log::debug("walking %s (max depth %zu)", walker.opts_.root.string().c_str(),
               walker.opts_.effective_max_depth());
    return Result<Walker>::ok(std::move(walker));
}

void Walker::warn(const std::string& message, const fs::path& path) {
    FnrError w{FnrError::WalkWarning, message, "", path.string()};
    log::debug("walk warning %s: %s", path.string().c_str(), message.c_str());
    warnings_.push_back(std::move(w));
}

void Walker::push_dir(const fs::path& dir, const std::string& rel,
                      size_t depth, const fs::path& canonical) {
    Frame frame;
    frame.dir = dir;
    frame.rel = rel;
    frame.depth = depth;
    frame.canonical = canonical;

    std::error_code ec;
    if (opts_.honor_ignore) {
        // Repository-local excludes rank below the root's own ignore files
        std::vector<fs::path> candidates;
        if (depth == 0) candidates.push_back(dir / ".git" / "info" / "exclude");
        for (const char* name : IGNORE_FILE_NAMES) candidates.push_back(dir / name);

        for (const auto& candidate : candidates) {
            if (!fs::is_regular_file(candidate, ec)) continue;
            auto loaded = IgnoreFile::load(candidate);
            if (loaded.is_err()) {
                warn(loaded.error().message, candidate);
                continue;
            }
            frame.ignore.append(loaded.value());
        }
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        warn("cannot read directory: " + ec.message(), dir);
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            warn("error while reading directory: " + ec.message(), dir);
            break;
        }
        frame.children.push_back(*it);
    }
    std::sort(frame.children.begin(), frame.children.end(),
        [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename().string() < b.path().filename().string();
        });

    log::trace("entered %s (%zu entries)", dir.string().c_str(), frame.children.size());
    stack_.push_back(std::move(frame));
}

bool Walker::is_ignored(const std::string& rel, bool is_dir) const {
    // Deeper ignore files take precedence over shallower ones
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
        if (it->ignore.empty()) continue;
        std::string sub = it->rel.empty() ? rel : rel.substr(it->rel.size() + 1);
        auto verdict = it->ignore.decide(sub, is_dir);
        if (verdict.has_value()) return verdict.value();
    }
    return false;
}

bool Walker::is_ancestor_dir(const fs::path& canonical) const {
    for (const auto& frame : stack_) {
        if (frame.canonical == canonical) return true;
    }
    return false;
}

std::optional<WalkEntry> Walker::next() {
    const size_t max_depth = opts_.effective_max_depth();
    const size_t min_depth = opts_.effective_min_depth();

    while (!stack_.empty()) {
        Frame& top = stack_.back();
        if (top.index >= top.children.size()) {
            stack_.pop_back();
            continue;
        }

        const fs::directory_entry child = top.children[top.index++];
        const std::string name = child.path().filename().string();
        const std::string rel = top.rel.empty() ? name : top.rel + "/" + name;
        const size_t depth = top.depth + 1;
        const fs::path parent_canonical = top.canonical;

        if (!opts_.include_hidden && !name.empty() && name[0] == '.') continue;
        if (opts_.honor_ignore && name == ".git") continue;

        std::error_code ec;
        bool is_symlink = child.is_symlink(ec);
        if (ec) {
            warn("cannot stat entry: " + ec.message(), child.path());
            continue;
        }

        bool is_dir = false;
        if (is_symlink && opts_.follow_symlinks) {
            auto st = fs::status(child.path(), ec);
            if (ec || !fs::exists(st)) {
                warn("broken symbolic link", child.path());
                continue;
            }
            is_dir = fs::is_directory(st);
        } else if (!is_symlink) {
            is_dir = child.is_directory(ec);
            if (ec) {
                warn("cannot stat entry: " + ec.message(), child.path());
                continue;
            }
        }

        if (opts_.honor_ignore && is_ignored(rel, is_dir)) {
            log::trace("ignored %s", rel.c_str());
            continue;
        }

        if (is_dir && depth < max_depth) {
            if (is_symlink) {
                auto target = fs::canonical(child.path(), ec);
                if (ec) {
                    warn("cannot resolve symbolic link: " + ec.message(), child.path());
                    continue;
                }
                if (is_ancestor_dir(target)) {
                    warn("file system loop found: link points to an ancestor directory",
                         child.path());
                    continue;
                }
                push_dir(child.path(), rel, depth, target);
            } else {
                push_dir(child.path(), rel, depth, parent_canonical / name);
            }
        }

        if (depth < min_depth) continue;

        WalkEntry entry;
        entry.path = child.path();
        entry.rel_path = rel;
        entry.depth = depth;
        entry.is_dir = is_dir;
        entry.is_symlink = is_symlink;
        return entry;
    }

    return std::nullopt;
}

} // namespace fnr
