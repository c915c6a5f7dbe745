#pragma once

#include <fnr/error.hpp>
#include <fnr/core/match.hpp>
#include <filesystem>
#include <vector>

namespace fnr {

// Receives every resolved match and outcome. Rendering is entirely up to
// the implementation; the default methods do nothing.
class Display {
public:
    virtual ~Display() = default;

    // Search mode result
    virtual void show_match(const Match& m) { (void)m; }
    // Dry-run before/after pair
    virtual void show_preview(const Match& m) { (void)m; }
    virtual void show_renamed(const Match& m, const std::filesystem::path& dest) {
        (void)m;
        (void)dest;
    }
    virtual void show_skipped(const Match& m) { (void)m; }
    // Entries the walker had to skip
    virtual void show_warning(const FnrError& w) { (void)w; }
    // Rejected matches and failed renames
    virtual void show_error(const FnrError& e) { (void)e; }
};

enum class Decision { Yes, No, All, Quit };

const char* decision_name(Decision d);

// Blocking, one call per prompted match.
class DecisionSource {
public:
    virtual ~DecisionSource() = default;
    virtual Decision decide(const Match& m, const std::filesystem::path& dest) = 0;
};

// Replays a fixed list of decisions, then keeps returning `fallback`.
class ScriptedDecisionSource : public DecisionSource {
public:
    explicit ScriptedDecisionSource(std::vector<Decision> script,
                                    Decision fallback = Decision::Quit)
        : script_(std::move(script)), fallback_(fallback) {}

    Decision decide(const Match& m, const std::filesystem::path& dest) override;

    size_t asked() const { return asked_; }

private:
    std::vector<Decision> script_;
    Decision fallback_;
    size_t asked_ = 0;
};

} // namespace fnr
