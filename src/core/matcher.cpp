#include <fnr/core/matcher.hpp>
#include <fnr/log.hpp>
#include <algorithm>
#include <cctype>

namespace fnr {

std::string ascii_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

static std::string strip_wildcards(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size());
    for (char c : pattern) {
        if (c != '*') out.push_back(c);
    }
    return out;
}

static bool single_wildcard(const std::string& pattern, std::string& prefix,
                            std::string& suffix) {
    auto star = pattern.find('*');
    if (star == std::string::npos) return false;
    if (pattern.find('*', star + 1) != std::string::npos) return false;
    prefix = pattern.substr(0, star);
    suffix = pattern.substr(star + 1);
    return true;
}

static bool starts_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

static bool ends_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

bool simple_match(const std::string& text, const std::string& pattern) {
    std::string prefix, suffix;
    if (single_wildcard(pattern, prefix, suffix)) {
        // Prefix and suffix may not share characters of the text
        return text.size() >= prefix.size() + suffix.size() &&
               starts_with(text, prefix) && ends_with(text, suffix);
    }
    return text.find(strip_wildcards(pattern)) != std::string::npos;
}

std::optional<Span> find_literal(const std::string& text, const std::string& pattern,
                                 bool case_sensitive) {
    std::string needle = strip_wildcards(pattern);
    size_t pos = case_sensitive
        ? text.find(needle)
        : ascii_lower(text).find(ascii_lower(needle));
    if (pos == std::string::npos) return std::nullopt;
    return Span{pos, needle.size()};
}

std::string simple_replace(const std::string& text, const std::string& pattern,
                           const std::string& replacement, bool case_sensitive) {
    std::string prefix, suffix;
    if (single_wildcard(pattern, prefix, suffix)) {
        std::string folded = case_sensitive ? text : ascii_lower(text);
        std::string p = case_sensitive ? prefix : ascii_lower(prefix);
        std::string s = case_sensitive ? suffix : ascii_lower(suffix);
        if (!simple_match(folded, p + "*" + s)) return text;

        std::string middle = text.substr(prefix.size(),
                                         text.size() - prefix.size() - suffix.size());
        std::string rep_prefix, rep_suffix;
        if (single_wildcard(replacement, rep_prefix, rep_suffix)) {
            return rep_prefix + middle + rep_suffix;
        }
        return replacement;
    }

    auto span = find_literal(text, pattern, case_sensitive);
    if (!span.has_value()) return text;

    std::string out(text);
    out.replace(span->pos, span->len, replacement);
    return out;
}

Result<Matcher> Matcher::create(const PatternConfig& cfg) {
    if (cfg.pattern.empty()) {
        return FnrError{FnrError::InvalidPattern, "search pattern is empty"};
    }
    std::string prefix, suffix;
    if (!cfg.regex && strip_wildcards(cfg.pattern).empty() &&
        !single_wildcard(cfg.pattern, prefix, suffix)) {
        return FnrError{FnrError::InvalidPattern,
            "pattern '" + cfg.pattern + "' has no literal text",
            "use a single '*' to select every name"};
    }

    Matcher m(cfg);
    if (cfg.regex) {
        auto flags = std::regex::ECMAScript;
        if (!cfg.case_sensitive) flags |= std::regex::icase;
        try {
            m.regex_ = std::make_shared<const std::regex>(cfg.pattern, flags);
        } catch (const std::regex_error& e) {
            return FnrError{FnrError::InvalidPattern,
                "invalid regex pattern '" + cfg.pattern + "': " + e.what(),
                "regex mode uses ECMAScript syntax"};
        }
    }

    log::debug("pattern '%s' (%s, %s)", cfg.pattern.c_str(),
               cfg.regex ? "regex" : "literal",
               cfg.case_sensitive ? "case-sensitive" : "case-insensitive");
    return Result<Matcher>::ok(std::move(m));
}

bool Matcher::matches(const std::string& filename) const {
    if (regex_) {
        return std::regex_search(filename, *regex_);
    }
    if (cfg_.case_sensitive) {
        return simple_match(filename, cfg_.pattern);
    }
    return simple_match(ascii_lower(filename), ascii_lower(cfg_.pattern));
}

std::optional<std::string> Matcher::apply(const std::string& filename) const {
    if (!matches(filename)) return std::nullopt;
    if (!cfg_.replacement.has_value()) return filename;

    if (regex_) {
        return std::regex_replace(filename, *regex_, cfg_.replacement.value());
    }
    return simple_replace(filename, cfg_.pattern, cfg_.replacement.value(),
                          cfg_.case_sensitive);
}

} // namespace fnr
