#pragma once

#include <fnr/core/display.hpp>
#include <fnr/core/matcher.hpp>
#include <fnr/core/sequencer.hpp>
#include <iosfwd>
#include <memory>
#include <optional>
#include <regex>
#include <string>

namespace fnr {

namespace color {
constexpr const char* RESET  = "\033[0m";
constexpr const char* BOLD   = "\033[1m";
constexpr const char* WHITE  = "\033[37m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* GREEN  = "\033[32m";
constexpr const char* BLUE   = "\033[34m";
constexpr const char* CYAN   = "\033[36m";
constexpr const char* RED    = "\033[31m";
} // namespace color

// Text output for the fnr command: search listings, dry-run previews,
// rename reports and the interactive prompt.
class ConsoleDisplay : public Display {
public:
    ConsoleDisplay(std::ostream& out, std::ostream& err, bool use_color,
                   const PatternConfig& pattern);

    void show_match(const Match& m) override;
    void show_preview(const Match& m) override;
    void show_renamed(const Match& m, const std::filesystem::path& dest) override;
    void show_skipped(const Match& m) override;
    void show_warning(const FnrError& w) override;
    void show_error(const FnrError& e) override;

    void print_dry_run_header();
    void print_no_matches();
    void print_prompt();
    void print_summary(const BatchReport& report);

    // "    <dir>/<old>" and " -> <dir>/<new>" with the changed text marked
    void print_before_after(const Match& m);

    // Old filename with the matched text in yellow
    std::string highlight_old(const Match& m) const;
    // New filename with the inserted text in yellow
    std::string highlight_new(const Match& m) const;

    std::ostream& out() { return out_; }

private:
    std::string paint(const std::string& text, const char* code) const;
    // Byte range of the first match in `name`, in whichever mode is active
    bool locate(const std::string& name, size_t& pos, size_t& len) const;

    std::ostream& out_;
    std::ostream& err_;
    bool use_color_;
    PatternConfig pattern_;
    std::shared_ptr<const std::regex> regex_;
};

// Reads single keystrokes from the controlling terminal.
// y/Y/Enter -> Yes, n/N -> No, a/A -> All, q/Q/Esc/Ctrl-C/EOF -> Quit.
class TerminalDecisionSource : public DecisionSource {
public:
    explicit TerminalDecisionSource(ConsoleDisplay& display, int fd = 0)
        : display_(display), fd_(fd) {}

    Decision decide(const Match& m, const std::filesystem::path& dest) override;

    // Keystroke mapping; nullopt for keys that are ignored
    static std::optional<Decision> decode_key(int key);

private:
    int read_key();

    ConsoleDisplay& display_;
    int fd_;
};

} // namespace fnr
