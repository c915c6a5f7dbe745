#include <fnr/cli/app.hpp>
#include <fnr/cli/console.hpp>
#include <fnr/core/collector.hpp>
#include <fnr/core/sequencer.hpp>
#include <fnr/log.hpp>
#include <ostream>

namespace fnr {

static Result<Config> resolve_config(const RunOptions& opts) {
    std::optional<Config> global;
    if (!opts.config_path.empty()) {
        auto explicit_cfg = Config::load(opts.config_path);
        FNR_TRY(explicit_cfg);
        global = std::move(explicit_cfg).value();
    } else if (opts.use_global_config) {
        auto loaded = Config::load_if_present(global_config_path());
        FNR_TRY(loaded);
        global = std::move(loaded).value();
    }

    std::optional<Config> project;
    if (opts.use_project_config) {
        auto path = project_config_path(opts.base_dir);
        auto loaded = Config::load_if_present(path);
        FNR_TRY(loaded);
        project = std::move(loaded).value();
        // A file inside the scanned tree may not turn off confirmation
        if (project.has_value() && project->interactive == false) {
            log::warn("%s: ignoring [rename] interactive = false", path.c_str());
            project->interactive.reset();
        }
    }

    return Result<Config>::ok(Config::effective(global, project, opts.cli));
}

static void report_fatal(const FnrError& e, std::ostream& err) {
    err << e.format() << "\n";
}

int run(const RunOptions& opts, std::ostream& out, std::ostream& err,
        DecisionSource* decisions) {
    auto cfg = resolve_config(opts);
    if (cfg.is_err()) {
        report_fatal(cfg.error(), err);
        return EXIT_FATAL;
    }
    const Config& settings = cfg.value();

    if (settings.log_level.has_value()) {
        // Validated when the layer was parsed
        log::set_level(log::parse_level(settings.log_level.value()).value_or(log::Warn));
    }

    WalkOptions walk;
    walk.root = opts.base_dir;
    FilterConfig filter;
    PatternConfig pattern = opts.pattern;
    settings.apply(walk, filter, pattern);

    ConsoleDisplay display(out, err, settings.color.value_or(opts.default_color), pattern);

    auto collected = collect(walk, filter, pattern);
    if (collected.is_err()) {
        report_fatal(collected.error(), err);
        return EXIT_FATAL;
    }
    for (const auto& w : collected.value().warnings) {
        display.show_warning(w);
    }

    auto& matches = collected.value().matches;
    if (!pattern.rename_mode()) {
        for (const auto& m : matches) display.show_match(m);
        return EXIT_OK;
    }

    if (matches.empty()) {
        display.print_no_matches();
        return EXIT_OK;
    }

    RenamePlan plan = plan_renames(std::move(matches));

    ApplyMode mode = ApplyMode::Force;
    if (opts.dry_run) {
        mode = ApplyMode::DryRun;
        display.print_dry_run_header();
    } else if (settings.interactive.value_or(true)) {
        mode = ApplyMode::Interactive;
    }

    TerminalDecisionSource terminal(display);
    Sequencer sequencer(display, decisions ? decisions : &terminal);
    auto report = sequencer.apply(plan, mode);
    if (report.is_err()) {
        report_fatal(report.error(), err);
        return EXIT_FATAL;
    }

    if (mode != ApplyMode::DryRun) {
        display.print_summary(report.value());
    }
    return report.value().clean() ? EXIT_OK : EXIT_PARTIAL;
}

} // namespace fnr
