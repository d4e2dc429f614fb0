#pragma once

#include "utils.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace plansync {

    using namespace std::string_view_literals;

    /*
     * Plansync Config Options
     *
     * Fixture and harness
     * - fixture_path: Source file holding the expected-value literals to rewrite.
     * - harness_command: argv of the test harness (first token is the executable).
     * - filter_flag: Flag placed before the test filter (e.g. "-run" for go test).
     * - filter: Test-selection filter handed to the harness; omitted when empty.
     * - working_dir: Directory the harness runs in.
     *
     * Failure recognition
     * - section_marker: Delimiter that introduces one failure section in harness output.
     * - failure_word: Word whose absence means every selected test passed.
     *
     * Matching
     * - numeric_labels: Prefixes that introduce a patchable numeric value (e.g. "estimated cost=").
     * - context_radius: Lines kept on each side of a differing line by the context-block matcher.
     *
     * Loop control
     * - max_iterations: Cap on harness invocations before the run is reported exhausted.
     *
     * Output
     * - output: Report shape ("table" or "json").
     * - color: ANSI color behavior for the final status line.
     * - quiet/verbose: Coarse verbosity knobs for progress lines.
     *
     * Introspection flags (one-shot startup actions)
     * - config_file: Optional JSON file merged before command-line overrides.
     * - print_config: Print resolved config and exit.
     */

    enum class output_mode { table, json };
    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr auto default_section_marker = "Not equal:"sv;
    inline constexpr auto default_failure_word = "FAIL"sv;
    inline constexpr size_t default_context_radius = 2U;
    inline constexpr int default_max_iterations = 5;

    inline std::vector<std::string> default_numeric_labels() {
        return {"estimated cost=", "cost=", "rows="};
    }

    struct reconcile_config {
        std::filesystem::path fixture_path{};
        std::vector<std::string> harness_command{"go", "test", "./..."};
        std::string filter_flag{"-run"};
        std::string filter{};
        std::filesystem::path working_dir{"."};

        std::string section_marker{default_section_marker};
        std::string failure_word{default_failure_word};

        std::vector<std::string> numeric_labels{default_numeric_labels()};
        size_t context_radius{default_context_radius};

        int max_iterations{default_max_iterations};

        output_mode output{output_mode::table};
        color_mode color{color_mode::automatic};
        bool quiet{false};
        bool verbose{false};

        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};
    };

}  // namespace plansync
