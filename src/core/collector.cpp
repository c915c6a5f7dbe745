#include <fnr/core/collector.hpp>
#include <fnr/glob.hpp>
#include <fnr/log.hpp>

namespace fnr {

Result<EntryType> parse_entry_type(const std::string& name) {
    if (name == "file" || name == "f") return Result<EntryType>::ok(EntryType::File);
    if (name == "dir" || name == "d") return Result<EntryType>::ok(EntryType::Dir);
    if (name == "both" || name == "b") return Result<EntryType>::ok(EntryType::Both);
    return FnrError{FnrError::InvalidArg,
        "unknown entry type '" + name + "'",
        "expected one of: file, dir, both"};
}

const char* entry_type_name(EntryType t) {
    switch (t) {
        case EntryType::File: return "file";
        case EntryType::Dir:  return "dir";
        case EntryType::Both: return "both";
    }
    return "unknown";
}

static bool type_accepts(EntryType t, bool is_dir) {
    switch (t) {
        case EntryType::File: return !is_dir;
        case EntryType::Dir:  return is_dir;
        case EntryType::Both: return true;
    }
    return true;
}

Result<Collection> collect(const WalkOptions& walk,
                           const FilterConfig& filter,
                           const PatternConfig& pattern) {
    auto matcher = Matcher::create(pattern);
    FNR_TRY(matcher);

    auto globs = GlobSet::compile(filter.globs);
    FNR_TRY(globs);

    auto walker = Walker::open(walk);
    FNR_TRY(walker);

    Collection out;
    const std::string replacement = pattern.replacement.value_or("");
    size_t seen = 0;

    while (auto entry = walker.value().next()) {
        seen++;
        if (!globs.value().matches(entry->rel_path)) continue;
        if (!type_accepts(filter.type, entry->is_dir)) continue;

        auto new_name = matcher.value().apply(entry->path.filename().string());
        if (!new_name.has_value()) continue;

        Match m;
        m.path = entry->path;
        m.new_name = std::move(new_name).value();
        m.is_dir = entry->is_dir;
        m.pattern = pattern.pattern;
        m.replacement = replacement;
        out.matches.push_back(std::move(m));
    }

    out.warnings = walker.value().warnings();
    log::debug("visited %zu entries, %zu matched, %zu warnings",
               seen, out.matches.size(), out.warnings.size());
    return Result<Collection>::ok(std::move(out));
}

} // namespace fnr
