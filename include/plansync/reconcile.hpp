#pragma once

#include "config.hpp"
#include "failure.hpp"
#include "harness.hpp"
#include "strategy.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace plansync {

    enum class reconcile_status : uint8_t {
        running,
        converged,
        exhausted,
        stalled,
    };

    inline constexpr std::string_view to_string(reconcile_status status) {
        switch (status) {
            case reconcile_status::running:
                return "running"sv;
            case reconcile_status::converged:
                return "converged"sv;
            case reconcile_status::exhausted:
                return "exhausted"sv;
            case reconcile_status::stalled:
                return "stalled"sv;
        }
        return "running"sv;
    }

    inline constexpr bool is_terminal(reconcile_status status) {
        return status != reconcile_status::running;
    }

    struct reconcile_session {
        int iteration{0};
        int max_iterations{default_max_iterations};
        // pre-edit failure count of every patching iteration
        std::vector<size_t> failure_count_history{};
        std::vector<size_t> applied_count_history{};
        reconcile_status status{reconcile_status::running};
    };

    struct reconcile_options {
        harness_request harness{};
        std::filesystem::path fixture_path{};
        failure_parse_options parse{};
        match_options match{};
        std::string failure_word{default_failure_word};
    };

    struct iteration_report {
        int iteration{};
        size_t failure_count{};
        size_t applied_count{};
        int harness_exit_code{};
        // previous failure count minus this one; positive when failures went down
        std::optional<std::int64_t> progress{};
        bool unrecognized_failures{false};
        // edits that landed in the fixture; planned edits whose search text vanished go to `skipped`
        std::vector<edit_entry> edits{};
        std::vector<edit_entry> skipped{};
        std::vector<failure_record> unmatched{};
        // failures seen on the final, capped iteration when the loop stops exhausted
        std::vector<failure_record> remaining{};
        reconcile_status status{reconcile_status::running};
    };

    struct step_result {
        reconcile_session session{};
        iteration_report report{};
    };

    struct reconcile_outcome {
        reconcile_session session{};
        std::vector<iteration_report> iterations{};

        reconcile_status status() const { return session.status; }
        const iteration_report* last() const { return iterations.empty() ? nullptr : &iterations.back(); }
        size_t remaining_failures() const;
    };

    using iteration_observer = std::function<void(const iteration_report&)>;

    reconcile_options make_reconcile_options(const reconcile_config& cfg);

    reconcile_session start_session(int max_iterations);

    // One run -> parse -> patch pass; throws on fixture or harness I/O failure
    step_result reconcile_step(reconcile_session session, const harness_fn& harness, const reconcile_options& options);

    reconcile_outcome run_reconciliation(
            const reconcile_options& options,
            int max_iterations,
            const harness_fn& harness,
            const iteration_observer& observer = {});

}  // namespace plansync
