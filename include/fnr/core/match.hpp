#pragma once

#include <filesystem>
#include <string>

namespace fnr {

// One filesystem entry selected for reporting or renaming.
// new_name is computed once from the original filename and never
// recomputed, even after an ancestor directory has been renamed.
struct Match {
    std::filesystem::path path;
    std::string new_name;
    bool is_dir = false;
    std::string pattern;
    std::string replacement;

    std::string filename() const { return path.filename().string(); }

    // parent(path) / new_name
    std::filesystem::path destination() const;

    // Number of path components; directories are renamed deepest first
    size_t depth() const;

    bool is_noop() const { return filename() == new_name; }
};

} // namespace fnr
