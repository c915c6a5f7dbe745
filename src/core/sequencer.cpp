#include <fnr/core/sequencer.hpp>
#include <fnr/log.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace fnr {

namespace fs = std::filesystem;

ConfirmStep advance(ConfirmState state, Decision d) {
    if (state == ConfirmState::ApplyRemaining) {
        return {ConfirmState::ApplyRemaining, StepAction::Rename};
    }
    switch (d) {
        case Decision::Yes:  return {ConfirmState::Prompting, StepAction::Rename};
        case Decision::No:   return {ConfirmState::Prompting, StepAction::Skip};
        case Decision::All:  return {ConfirmState::ApplyRemaining, StepAction::Rename};
        case Decision::Quit: return {ConfirmState::Prompting, StepAction::Stop};
    }
    return {state, StepAction::Stop};
}

std::vector<Match> order_matches(std::vector<Match> matches) {
    std::stable_sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
        if (a.is_dir != b.is_dir) return !a.is_dir;
        if (!a.is_dir) return false;
        return a.depth() > b.depth();
    });
    return matches;
}

Status validate_new_name(const std::string& name) {
    if (name.empty()) {
        return FnrError{FnrError::InvalidName, "replacement produces an empty name"};
    }
    if (name == "." || name == "..") {
        return FnrError{FnrError::InvalidName,
            "replacement produces the reserved name '" + name + "'"};
    }
    if (name.find('/') != std::string::npos) {
        return FnrError{FnrError::InvalidName,
            "new name '" + name + "' contains a path separator",
            "a rename may not move an entry to another directory"};
    }
    if (name.find('\0') != std::string::npos) {
        return FnrError{FnrError::InvalidName, "new name contains a NUL byte"};
    }
    return ok_status();
}

RenamePlan plan_renames(std::vector<Match> matches) {
    RenamePlan plan;
    std::vector<Match> valid;
    valid.reserve(matches.size());

    for (auto& m : matches) {
        if (m.is_noop()) {
            plan.unchanged++;
            continue;
        }
        auto ok = validate_new_name(m.new_name);
        if (ok.is_err()) {
            auto err = std::move(ok).error();
            err.path = m.path.string();
            plan.rejected.push_back(std::move(err));
            continue;
        }
        valid.push_back(std::move(m));
    }

    // Two entries renamed onto the same path: reject every one of them
    std::unordered_map<std::string, size_t> targets;
    for (const auto& m : valid) {
        targets[m.destination().lexically_normal().string()]++;
    }

    std::vector<Match> accepted;
    accepted.reserve(valid.size());
    for (auto& m : valid) {
        std::string dest = m.destination().lexically_normal().string();
        size_t count = targets[dest];
        if (count > 1) {
            FnrError err{FnrError::Collision,
                std::to_string(count) + " entries would be renamed to the same path",
                "", m.path.string()};
            err.destination = m.destination().string();
            plan.rejected.push_back(std::move(err));
            continue;
        }
        accepted.push_back(std::move(m));
    }

    plan.steps = order_matches(std::move(accepted));
    log::debug("planned %zu renames (%zu rejected, %zu unchanged)",
               plan.steps.size(), plan.rejected.size(), plan.unchanged);
    return plan;
}

static bool differs_only_in_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

Status rename_one(const Match& m) {
    const fs::path dest = m.destination();
    std::error_code ec;

    auto source = fs::symlink_status(m.path, ec);
    if (source.type() == fs::file_type::not_found) {
        return FnrError::rename_failed(m.path.string(), dest.string(),
            "source no longer exists");
    }
    if (ec) {
        return FnrError::rename_failed(m.path.string(), dest.string(), ec.message());
    }

    auto target = fs::symlink_status(dest, ec);
    if (ec && target.type() != fs::file_type::not_found) {
        return FnrError::rename_failed(m.path.string(), dest.string(), ec.message());
    }
    if (fs::exists(target)) {
        // Case-only renames on case-insensitive filesystems see themselves
        bool same_entry = differs_only_in_case(m.filename(), m.new_name) &&
                          fs::equivalent(m.path, dest, ec) && !ec;
        if (!same_entry) {
            return FnrError::rename_failed(m.path.string(), dest.string(),
                "destination already exists");
        }
    }

    fs::rename(m.path, dest, ec);
    if (ec) {
        return FnrError::rename_failed(m.path.string(), dest.string(), ec.message());
    }
    return ok_status();
}

void Sequencer::rename_step(const Match& m, BatchReport& report) {
    auto st = rename_one(m);
    if (st.is_err()) {
        log::debug("rename failed: %s", st.error().message.c_str());
        display_.show_error(st.error());
        report.errors.push_back(std::move(st).error());
        report.failed++;
        return;
    }
    log::trace("renamed %s -> %s", m.path.string().c_str(), m.new_name.c_str());
    display_.show_renamed(m, m.destination());
    report.renamed++;
}

Result<BatchReport> Sequencer::apply(const RenamePlan& plan, ApplyMode mode) {
    if (mode == ApplyMode::Interactive && decisions_ == nullptr) {
        return FnrError{FnrError::InvalidArg,
            "interactive mode needs a decision source",
            "use forced or dry-run mode for headless runs"};
    }

    BatchReport report;
    report.unchanged = plan.unchanged;
    for (const auto& err : plan.rejected) {
        display_.show_error(err);
        report.errors.push_back(err);
        report.rejected++;
    }

    ConfirmState state = ConfirmState::Prompting;
    for (const auto& m : plan.steps) {
        switch (mode) {
            case ApplyMode::DryRun:
                display_.show_preview(m);
                report.previewed++;
                break;

            case ApplyMode::Force:
                rename_step(m, report);
                break;

            case ApplyMode::Interactive: {
                Decision d = Decision::Yes;
                if (state == ConfirmState::Prompting) {
                    d = decisions_->decide(m, m.destination());
                    log::trace("decision for %s: %s", m.path.string().c_str(), decision_name(d));
                }
                ConfirmStep step = advance(state, d);
                state = step.next;
                if (step.action == StepAction::Stop) {
                    report.quit = true;
                    return Result<BatchReport>::ok(std::move(report));
                }
                if (step.action == StepAction::Skip) {
                    display_.show_skipped(m);
                    report.skipped++;
                    break;
                }
                rename_step(m, report);
                break;
            }
        }
    }

    return Result<BatchReport>::ok(std::move(report));
}

} // namespace fnr
