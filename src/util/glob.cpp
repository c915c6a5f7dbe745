#include <fnr/glob.hpp>
#include <algorithm>

namespace fnr {

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    while (out.size() > 2 && out[0] == '.' && out[1] == '/') {
        out.erase(0, 2);
    }
    // Remove trailing slash (unless the entire string is "/")
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

static std::string last_segment(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

// Match a single segment against a pattern segment (no '/' in either).
// Supports *, ?, [abc], [a-z], [!...].
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            pi++;
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++; // skip ']'
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) return true;
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_segment(ps, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// Index of the '}' closing the '{' at `open`, or npos.
static size_t find_closing_brace(const std::string& s, size_t open) {
    int depth = 0;
    bool in_class = false;
    for (size_t i = open; i < s.size(); i++) {
        char c = s[i];
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == '{') {
            depth++;
        } else if (c == '}') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Split brace body on commas that are not nested in another brace group.
static std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> alts;
    std::string cur;
    int depth = 0;
    bool in_class = false;
    for (char c : body) {
        if (in_class) {
            if (c == ']') in_class = false;
        } else if (c == '[') {
            in_class = true;
        } else if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
        } else if (c == ',' && depth == 0) {
            alts.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    alts.push_back(cur);
    return alts;
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    auto norm_pat = normalize_path(pattern);
    auto norm_path = normalize_path(path);

    auto pat_segs = split_segments(norm_pat);
    auto path_segs = split_segments(norm_path);

    return match_segments(pat_segs, 0, path_segs, 0);
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (!pattern.empty() && pattern[0] == '!') {
        inner = pattern.substr(1);
        return true;
    }
    return false;
}

Status glob_validate(const std::string& pattern) {
    if (pattern.empty()) {
        return FnrError{FnrError::InvalidPattern, "empty glob expression"};
    }

    int brace_depth = 0;
    for (size_t i = 0; i < pattern.size(); i++) {
        char c = pattern[i];
        if (c == '[') {
            size_t j = i + 1;
            if (j < pattern.size() && pattern[j] == '!') j++;
            // A class needs at least one member before the closing ']'
            size_t close = pattern.find(']', j + 1);
            size_t slash = pattern.find('/', j);
            if (j >= pattern.size() || close == std::string::npos ||
                (slash != std::string::npos && slash < close)) {
                return FnrError{FnrError::InvalidPattern,
                    "unterminated character class in glob '" + pattern + "'",
                    "close the class with ']'"};
            }
            i = close;
        } else if (c == '{') {
            brace_depth++;
        } else if (c == '}') {
            if (brace_depth == 0) {
                return FnrError{FnrError::InvalidPattern,
                    "unmatched '}' in glob '" + pattern + "'"};
            }
            brace_depth--;
        }
    }

    if (brace_depth != 0) {
        return FnrError{FnrError::InvalidPattern,
            "unterminated '{' in glob '" + pattern + "'",
            "alternation is written {a,b}"};
    }

    return ok_status();
}

std::vector<std::string> glob_expand_braces(const std::string& pattern) {
    bool in_class = false;
    for (size_t i = 0; i < pattern.size(); i++) {
        char c = pattern[i];
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
            continue;
        }
        if (c != '{') continue;

        size_t close = find_closing_brace(pattern, i);
        if (close == std::string::npos) break;

        std::string prefix = pattern.substr(0, i);
        std::string suffix = pattern.substr(close + 1);
        std::vector<std::string> out;
        for (const auto& alt : split_alternatives(pattern.substr(i + 1, close - i - 1))) {
            auto expanded = glob_expand_braces(prefix + alt + suffix);
            out.insert(out.end(), expanded.begin(), expanded.end());
        }
        return out;
    }
    return {pattern};
}

Result<GlobSet> GlobSet::compile(const std::vector<std::string>& patterns) {
    GlobSet set;
    std::vector<std::string> sources = patterns;
    if (sources.empty()) {
        sources.push_back(MATCH_ALL);
    }

    bool any_include = false;
    for (const auto& raw : sources) {
        Rule rule;
        std::string body = raw;
        std::string inner;
        if (glob_is_negation(raw, inner)) {
            rule.negated = true;
            body = inner;
        } else {
            any_include = true;
        }

        auto valid = glob_validate(body);
        if (valid.is_err()) {
            auto err = std::move(valid).error();
            if (rule.negated) err.message += " (in negation '" + raw + "')";
            return err;
        }

        rule.alternatives = glob_expand_braces(body);
        rule.match_basename = std::none_of(
            rule.alternatives.begin(), rule.alternatives.end(),
            [](const std::string& alt) { return alt.find('/') != std::string::npos; });
        set.rules_.push_back(std::move(rule));
    }

    if (!any_include) {
        Rule all;
        all.alternatives = {MATCH_ALL};
        set.rules_.insert(set.rules_.begin(), std::move(all));
    }

    return Result<GlobSet>::ok(std::move(set));
}

bool GlobSet::matches(const std::string& path) const {
    auto norm = normalize_path(path);
    auto base = last_segment(norm);

    bool included = false;
    for (const auto& rule : rules_) {
        bool hit = false;
        for (const auto& alt : rule.alternatives) {
            if (glob_match(alt, norm) || (rule.match_basename && glob_match(alt, base))) {
                hit = true;
                break;
            }
        }
        if (hit) included = !rule.negated;
    }
    return included;
}

} // namespace fnr
