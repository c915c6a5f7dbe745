#include <fnr/core/ignore.hpp>
#include <fnr/glob.hpp>
#include <fstream>
#include <sstream>

namespace fnr {

const char* const IGNORE_FILE_NAMES[2] = {".gitignore", ".ignore"};

static std::string trim_trailing(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r");
    if (end == std::string::npos) return "";
    // A backslash-escaped trailing space is kept
    if (end + 1 < s.size() && s[end] == '\\') return s.substr(0, end) + " ";
    return s.substr(0, end + 1);
}

static std::string base_name(const std::string& rel) {
    auto pos = rel.rfind('/');
    return pos == std::string::npos ? rel : rel.substr(pos + 1);
}

IgnoreFile IgnoreFile::parse(const std::string& text) {
    IgnoreFile file;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        line = trim_trailing(line);
        if (line.empty() || line[0] == '#') continue;

        IgnoreRule rule;
        if (line[0] == '!') {
            rule.negated = true;
            line.erase(0, 1);
        } else if (line[0] == '\\' && line.size() > 1 &&
                   (line[1] == '#' || line[1] == '!')) {
            line.erase(0, 1);
        }

        if (!line.empty() && line.back() == '/') {
            rule.dir_only = true;
            line.pop_back();
        }
        if (!line.empty() && line[0] == '/') {
            rule.anchored = true;
            line.erase(0, 1);
        }
        if (line.find('/') != std::string::npos) {
            rule.anchored = true;
        }
        if (line.empty()) continue;

        rule.pattern = line;
        file.rules_.push_back(std::move(rule));
    }

    return file;
}

Result<IgnoreFile> IgnoreFile::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FnrError{FnrError::IO,
            "cannot read ignore file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<IgnoreFile>::ok(IgnoreFile::parse(ss.str()));
}

std::optional<bool> IgnoreFile::decide(const std::string& rel_path, bool is_dir) const {
    std::optional<bool> verdict;
    std::string name = base_name(rel_path);

    for (const auto& rule : rules_) {
        if (rule.dir_only && !is_dir) continue;

        bool hit = rule.anchored
            ? glob_match(rule.pattern, rel_path)
            : glob_match(rule.pattern, name);
        if (hit) verdict = !rule.negated;
    }

    return verdict;
}

void IgnoreFile::append(const IgnoreFile& other) {
    rules_.insert(rules_.end(), other.rules_.begin(), other.rules_.end());
}

} // namespace fnr
