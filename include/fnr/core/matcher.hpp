#pragma once

#include <fnr/result.hpp>
#include <memory>
#include <optional>
#include <regex>
#include <string>

namespace fnr {

struct PatternConfig {
    std::string pattern;
    // Present in rename mode, absent in search mode
    std::optional<std::string> replacement;
    bool regex = false;
    bool case_sensitive = false;

    bool rename_mode() const { return replacement.has_value(); }
};

// Literal/glob-lite containment test. A pattern with exactly one '*' is a
// prefix/suffix test on the whole text; any other pattern is a substring
// test with every '*' removed. Case folding is the caller's job.
bool simple_match(const std::string& text, const std::string& pattern);

// Literal/glob-lite replacement of the FIRST occurrence only.
// Single-'*' patterns carry the wildcard text into a single '*' of the
// replacement, or replace the whole text when the replacement has none.
// Case-insensitive mode locates the occurrence ignoring ASCII case and keeps
// the original casing around it.
std::string simple_replace(const std::string& text, const std::string& pattern,
                           const std::string& replacement, bool case_sensitive);

// Location of the first (case-folded) occurrence of `pattern` in `text`,
// used for highlighting. Wildcards are stripped before searching.
struct Span {
    size_t pos = 0;
    size_t len = 0;
};
std::optional<Span> find_literal(const std::string& text, const std::string& pattern,
                                 bool case_sensitive);

// Decides whether a filename matches and what it becomes.
//
// Regex mode replaces ALL occurrences (ECMAScript syntax, $1/$& captures);
// literal mode replaces only the FIRST. The asymmetry is intentional and
// relied on by existing users.
class Matcher {
public:
    // InvalidPattern on an empty pattern, a regex that does not compile, or
    // a literal pattern made only of two or more '*'
    static Result<Matcher> create(const PatternConfig& cfg);

    // Replacement text in rename mode, the unchanged filename in search
    // mode, nullopt when the filename does not match.
    std::optional<std::string> apply(const std::string& filename) const;

    bool matches(const std::string& filename) const;

    const PatternConfig& config() const { return cfg_; }

private:
    explicit Matcher(PatternConfig cfg) : cfg_(std::move(cfg)) {}

    PatternConfig cfg_;
    std::shared_ptr<const std::regex> regex_;
};

// ASCII lowercase, byte for byte so offsets stay valid in the original
std::string ascii_lower(const std::string& s);

} // namespace fnr
