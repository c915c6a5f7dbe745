#pragma once

#include <fnr/result.hpp>
#include <fnr/core/match.hpp>
#include <fnr/core/matcher.hpp>
#include <fnr/core/walker.hpp>
#include <string>
#include <vector>

namespace fnr {

enum class EntryType { File, Dir, Both };

// "file"/"f", "dir"/"d", "both"/"b"
Result<EntryType> parse_entry_type(const std::string& name);
const char* entry_type_name(EntryType t);

struct FilterConfig {
    std::vector<std::string> globs;  // empty = match everything
    EntryType type = EntryType::Both;
};

// One collector pass: the matches (in walker order, no ordering promise)
// plus the warnings raised while walking.
struct Collection {
    std::vector<Match> matches;
    std::vector<FnrError> warnings;

    bool empty() const { return matches.empty(); }
};

// Compile the pattern and globs, then walk. Pattern and glob errors are
// reported before the filesystem is touched.
Result<Collection> collect(const WalkOptions& walk,
                           const FilterConfig& filter,
                           const PatternConfig& pattern);

} // namespace fnr
