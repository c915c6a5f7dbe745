#pragma once

#include <fnr/result.hpp>
#include <fnr/core/display.hpp>
#include <fnr/core/match.hpp>
#include <string>
#include <vector>

namespace fnr {

enum class ApplyMode { DryRun, Interactive, Force };

// Interactive confirmation state threaded between prompts
enum class ConfirmState { Prompting, ApplyRemaining };

enum class StepAction { Rename, Skip, Stop };

struct ConfirmStep {
    ConfirmState next;
    StepAction action;
};

// Yes -> rename, No -> skip, All -> rename and stop prompting,
// Quit -> stop before this match.
ConfirmStep advance(ConfirmState state, Decision d);

// Validated, ordered batch ready to apply
struct RenamePlan {
    std::vector<Match> steps;
    std::vector<FnrError> rejected;   // InvalidName / Collision
    size_t unchanged = 0;             // new_name == current name
};

struct BatchReport {
    size_t renamed = 0;
    size_t previewed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t rejected = 0;
    size_t unchanged = 0;
    bool quit = false;
    std::vector<FnrError> errors;

    bool clean() const { return failed == 0 && rejected == 0; }
};

// Files first in discovery order, then directories deepest first.
// Any descendant of a directory in the batch comes before that directory.
std::vector<Match> order_matches(std::vector<Match> matches);

// InvalidName for "", ".", "..", or names holding '/' or NUL
Status validate_new_name(const std::string& name);

// Validate every match, reject collisions, drop no-ops, then order.
RenamePlan plan_renames(std::vector<Match> matches);

// Single rename(2) of m.path to m.destination(). Never overwrites.
Status rename_one(const Match& m);

class Sequencer {
public:
    // `decisions` is only consulted in Interactive mode
    explicit Sequencer(Display& display, DecisionSource* decisions = nullptr)
        : display_(display), decisions_(decisions) {}

    // Per-entry failures are collected in the report and never stop the
    // batch. Only a missing decision source in Interactive mode is an error.
    Result<BatchReport> apply(const RenamePlan& plan, ApplyMode mode);

private:
    void rename_step(const Match& m, BatchReport& report);

    Display& display_;
    DecisionSource* decisions_;
};

} // namespace fnr
