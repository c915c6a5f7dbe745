#include <fnr/cli/console.hpp>
#include <fnr/log.hpp>
#include <ostream>

namespace fnr {

ConsoleDisplay::ConsoleDisplay(std::ostream& out, std::ostream& err, bool use_color,
                               const PatternConfig& pattern)
    : out_(out), err_(err), use_color_(use_color), pattern_(pattern) {
    if (pattern_.regex) {
        auto flags = std::regex::ECMAScript;
        if (!pattern_.case_sensitive) flags |= std::regex::icase;
        try {
            regex_ = std::make_shared<const std::regex>(pattern_.pattern, flags);
        } catch (const std::regex_error& e) {
            // The matcher has already rejected this pattern; no highlighting
            log::debug("highlighting disabled: %s", e.what());
        }
    }
}

std::string ConsoleDisplay::paint(const std::string& text, const char* code) const {
    if (!use_color_) return text;
    return std::string(code) + text + color::RESET;
}

static bool has_single_wildcard(const std::string& pattern) {
    auto star = pattern.find('*');
    return star != std::string::npos && pattern.find('*', star + 1) == std::string::npos;
}

bool ConsoleDisplay::locate(const std::string& name, size_t& pos, size_t& len) const {
    if (pattern_.regex) {
        std::smatch m;
        if (!regex_ || !std::regex_search(name, m, *regex_)) return false;
        pos = static_cast<size_t>(m.position(0));
        len = static_cast<size_t>(m.length(0));
        return true;
    }
    if (has_single_wildcard(pattern_.pattern)) {
        pos = 0;
        len = name.size();
        return true;
    }
    auto span = find_literal(name, pattern_.pattern, pattern_.case_sensitive);
    if (!span.has_value()) return false;
    pos = span->pos;
    len = span->len;
    return true;
}

std::string ConsoleDisplay::highlight_old(const Match& m) const {
    std::string name = m.filename();
    size_t pos = 0, len = 0;
    if (!use_color_ || !locate(name, pos, len)) return paint(name, color::WHITE);

    return paint(name.substr(0, pos), color::WHITE) +
           paint(name.substr(pos, len), color::YELLOW) +
           paint(name.substr(pos + len), color::WHITE);
}

std::string ConsoleDisplay::highlight_new(const Match& m) const {
    std::string old_name = m.filename();
    size_t pos = 0, len = 0;
    if (!use_color_) return m.new_name;
    if (pattern_.regex || has_single_wildcard(pattern_.pattern) ||
        !locate(old_name, pos, len)) {
        return paint(m.new_name, color::YELLOW);
    }

    // Literal mode spliced the replacement in at `pos`
    size_t rep_len = m.replacement.size();
    if (pos + rep_len > m.new_name.size()) return paint(m.new_name, color::YELLOW);
    return paint(m.new_name.substr(0, pos), color::WHITE) +
           paint(m.new_name.substr(pos, rep_len), color::YELLOW) +
           paint(m.new_name.substr(pos + rep_len), color::WHITE);
}

static std::string parent_prefix(const Match& m) {
    auto parent = m.path.parent_path();
    if (parent.empty()) return "";
    return parent.string() + "/";
}

void ConsoleDisplay::print_before_after(const Match& m) {
    std::string parent = paint(parent_prefix(m), color::WHITE);
    out_ << "    " << parent << highlight_old(m) << "\n";
    out_ << " -> " << parent << highlight_new(m) << "\n";
}

void ConsoleDisplay::show_match(const Match& m) {
    const char* kind = m.is_dir ? "d" : "f";
    std::string tag = use_color_
        ? std::string(color::BOLD) + (m.is_dir ? color::BLUE : color::GREEN) + kind + color::RESET
        : std::string(kind);
    out_ << "[" << tag << "] " << paint(m.path.string(), color::WHITE) << "\n";
}

void ConsoleDisplay::show_preview(const Match& m) {
    print_before_after(m);
}

void ConsoleDisplay::show_renamed(const Match& m, const std::filesystem::path& dest) {
    if (!use_color_) {
        out_ << "Renamed: " << m.path.string() << " -> " << dest.string() << "\n";
        return;
    }
    out_ << color::BOLD << color::CYAN << "Renamed:" << color::RESET << " "
         << paint(m.path.string(), color::WHITE) << " "
         << color::BOLD << color::YELLOW << "->" << color::RESET << " "
         << color::BOLD << color::YELLOW << dest.string() << color::RESET << "\n";
}

void ConsoleDisplay::show_skipped(const Match& m) {
    log::info("skipped %s", m.path.string().c_str());
}

void ConsoleDisplay::show_warning(const FnrError& w) {
    std::string text = "warning: " + w.message;
    if (!w.path.empty()) text += " (" + w.path + ")";
    err_ << paint(text, color::YELLOW) << "\n";
}

void ConsoleDisplay::show_error(const FnrError& e) {
    if (use_color_) {
        err_ << color::RED << e.format() << color::RESET << "\n";
    } else {
        err_ << e.format() << "\n";
    }
}

void ConsoleDisplay::print_dry_run_header() {
    out_ << paint("Dry run - showing what would be renamed:", color::YELLOW) << "\n";
}

void ConsoleDisplay::print_no_matches() {
    out_ << "No matches found.\n";
}

void ConsoleDisplay::print_prompt() {
    out_ << paint("Replace filename/dirname? [Y]es/[n]o/[a]ll/[q]uit:", color::CYAN) << " ";
    out_.flush();
}

void ConsoleDisplay::print_summary(const BatchReport& report) {
    out_ << report.renamed << " renamed, " << report.skipped << " skipped, "
         << (report.failed + report.rejected) << " failed";
    if (report.unchanged > 0) out_ << ", " << report.unchanged << " unchanged";
    if (report.quit) out_ << " (quit)";
    out_ << "\n";
}

} // namespace fnr
