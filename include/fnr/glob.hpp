#pragma once

#include <fnr/result.hpp>
#include <string>
#include <vector>

namespace fnr {

// Match a glob pattern against a path (both normalized to forward slashes,
// a leading "./" ignored).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
// Braces are not handled here; see glob_expand_braces().
bool glob_match(const std::string& pattern, const std::string& path);

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Reject malformed expressions: empty, unterminated '[' or '{', stray '}'.
Status glob_validate(const std::string& pattern);

// Expand {a,b} alternation (nested allowed) into plain glob patterns.
// "**/*.{h,cpp}" -> {"**/*.h", "**/*.cpp"}
std::vector<std::string> glob_expand_braces(const std::string& pattern);

// Ordered include/exclude glob list, compiled once and tested per entry.
// Patterns prefixed with '!' exclude; the last matching pattern wins.
// A pattern without '/' is also tested against the final path segment.
class GlobSet {
public:
    static constexpr const char* MATCH_ALL = "**/*";

    // Empty input compiles to MATCH_ALL. A list holding only negations gets
    // an implicit MATCH_ALL include in front.
    static Result<GlobSet> compile(const std::vector<std::string>& patterns);

    // `path` is relative to the walk root.
    bool matches(const std::string& path) const;

private:
    struct Rule {
        std::vector<std::string> alternatives;
        bool negated = false;
        bool match_basename = false;
    };

    std::vector<Rule> rules_;
};

} // namespace fnr
