#include "plansync/reconcile.hpp"

#include "plansync/patcher.hpp"

#include <stdexcept>

namespace plansync {

    size_t reconcile_outcome::remaining_failures() const {
        if (auto* report = last()) {
            return report->failure_count;
        }
        return 0U;
    }

    reconcile_options make_reconcile_options(const reconcile_config& cfg) {
        reconcile_options options{};
        options.harness = make_harness_request(cfg);
        options.fixture_path = cfg.fixture_path;
        options.parse.section_marker = cfg.section_marker;
        options.match.numeric_labels = cfg.numeric_labels;
        options.match.context_radius = cfg.context_radius;
        options.failure_word = cfg.failure_word;
        return options;
    }

    reconcile_session start_session(int max_iterations) {
        if (max_iterations < 1) {
            throw std::invalid_argument("max_iterations must be at least 1");
        }
        reconcile_session session{};
        session.max_iterations = max_iterations;
        return session;
    }

    step_result reconcile_step(reconcile_session session, const harness_fn& harness, const reconcile_options& options) {
        if (is_terminal(session.status)) {
            throw std::logic_error("reconcile_step called on a finished session");
        }

        ++session.iteration;

        iteration_report report{};
        report.iteration = session.iteration;

        auto run = harness(options.harness);
        report.harness_exit_code = run.exit_code;

        auto records = parse_failures(run.output, options.parse);
        report.failure_count = records.size();
        if (!session.failure_count_history.empty()) {
            report.progress = static_cast<std::int64_t>(session.failure_count_history.back()) -
                              static_cast<std::int64_t>(records.size());
        }

        if (records.empty()) {
            report.unrecognized_failures = output_reports_failure(run.output, options.failure_word);
            session.status = reconcile_status::converged;
            report.status = session.status;
            return step_result{.session = std::move(session), .report = std::move(report)};
        }

        auto fixture = read_fixture(options.fixture_path);
        auto plan = build_edit_plan(records, fixture.content, options.match);
        auto patched = apply_edits(fixture.content, plan.edits);

        if (patched.applied_count > 0U) {
            fixture.content = std::move(patched.content);
            persist_fixture(fixture);
        }

        debug_log("iteration ", session.iteration, ": ", records.size(), " failure(s), ", patched.applied_count,
                  " edit(s) applied");

        session.failure_count_history.push_back(records.size());
        session.applied_count_history.push_back(patched.applied_count);

        report.applied_count = patched.applied_count;
        report.edits = std::move(patched.applied);
        report.skipped = std::move(patched.skipped);
        report.unmatched = std::move(plan.unmatched);

        if (patched.applied_count == 0U) {
            session.status = reconcile_status::stalled;
        }
        else if (session.iteration >= session.max_iterations) {
            report.remaining = std::move(records);
            session.status = reconcile_status::exhausted;
        }
        report.status = session.status;
        return step_result{.session = std::move(session), .report = std::move(report)};
    }

    reconcile_outcome run_reconciliation(
            const reconcile_options& options,
            int max_iterations,
            const harness_fn& harness,
            const iteration_observer& observer) {
        reconcile_outcome outcome{};
        outcome.session = start_session(max_iterations);

        while (!is_terminal(outcome.session.status)) {
            auto step = reconcile_step(std::move(outcome.session), harness, options);
            outcome.session = std::move(step.session);
            if (observer) {
                observer(step.report);
            }
            outcome.iterations.push_back(std::move(step.report));
        }

        return outcome;
    }

}  // namespace plansync
