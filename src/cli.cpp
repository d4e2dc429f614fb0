#include "plansync/cli.hpp"

#include "plansync/format.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace plansync::literals;

namespace plansync::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> fixture{};
        std::optional<std::vector<std::string>> harness{};
        std::optional<std::string> filter_flag{};
        std::optional<std::string> filter{};
        std::optional<std::string> working_dir{};
        std::optional<int> max_iterations{};
        std::optional<std::string> section_marker{};
        std::optional<std::string> failure_word{};
        std::optional<std::vector<std::string>> numeric_labels{};
        std::optional<int> context_radius{};
        std::optional<std::string> output{};
        std::optional<std::string> color{};
    };

    struct edit_record {
        std::string strategy{};
        std::string scope{};
        std::string search{};
        std::string replace{};
    };

    struct iteration_record {
        int iteration{};
        size_t failures{};
        size_t applied{};
        int harness_exit_code{};
        std::optional<std::int64_t> progress{};
        bool unrecognized_failures{false};
        std::vector<edit_record> edits{};
        std::vector<edit_record> skipped{};
        std::vector<failure_record> unmatched{};
    };

    struct reconcile_report {
        int schema_version{1};
        std::string status{};
        int iterations{};
        size_t remaining_failures{};
        std::vector<iteration_record> history{};
        std::vector<failure_record> remaining{};
    };

}}  // namespace plansync::cli::detail

namespace glz {

    template <>
    struct meta<plansync::cli::detail::persisted_config> {
        using T = plansync::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "fixture",
                       &T::fixture,
                       "harness",
                       &T::harness,
                       "filter_flag",
                       &T::filter_flag,
                       "filter",
                       &T::filter,
                       "working_dir",
                       &T::working_dir,
                       "max_iterations",
                       &T::max_iterations,
                       "section_marker",
                       &T::section_marker,
                       "failure_word",
                       &T::failure_word,
                       "numeric_labels",
                       &T::numeric_labels,
                       "context_radius",
                       &T::context_radius,
                       "output",
                       &T::output,
                       "color",
                       &T::color);
    };

    template <>
    struct meta<plansync::failure_record> {
        using T = plansync::failure_record;
        static constexpr auto value = object("expected", &T::expected, "actual", &T::actual);
    };

    template <>
    struct meta<plansync::cli::detail::edit_record> {
        using T = plansync::cli::detail::edit_record;
        static constexpr auto value =
                object("strategy", &T::strategy, "scope", &T::scope, "search", &T::search, "replace", &T::replace);
    };

    template <>
    struct meta<plansync::cli::detail::iteration_record> {
        using T = plansync::cli::detail::iteration_record;
        static constexpr auto value =
                object("iteration",
                       &T::iteration,
                       "failures",
                       &T::failures,
                       "applied",
                       &T::applied,
                       "harness_exit_code",
                       &T::harness_exit_code,
                       "progress",
                       &T::progress,
                       "unrecognized_failures",
                       &T::unrecognized_failures,
                       "edits",
                       &T::edits,
                       "skipped",
                       &T::skipped,
                       "unmatched",
                       &T::unmatched);
    };

    template <>
    struct meta<plansync::cli::detail::reconcile_report> {
        using T = plansync::cli::detail::reconcile_report;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "status",
                       &T::status,
                       "iterations",
                       &T::iterations,
                       "remaining_failures",
                       &T::remaining_failures,
                       "history",
                       &T::history,
                       "remaining",
                       &T::remaining);
    };

}  // namespace glz

namespace plansync::cli {

    namespace detail {

        static constexpr int supported_schema_version = 1;
        static constexpr size_t preview_width = 96U;

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        template <typename T>
        static T read_json_file(const fs::path& path) {
            T value{};
            auto json = read_text_file(path);
            auto ec = glz::read_json(value, json);
            if (ec) {
                throw std::runtime_error("failed to parse json file {}"_format(path.string()));
            }
            return value;
        }

        // First line of `text`, cut to the preview width
        static std::string preview(std::string_view text) {
            auto line_end = text.find('\n');
            auto line = text.substr(0U, line_end);
            if (line.size() > preview_width) {
                return std::string(line.substr(0U, preview_width)) + "...";
            }
            if (line_end != std::string_view::npos) {
                return std::string(line) + " ...";
            }
            return std::string(line);
        }

        static bool color_enabled(color_mode mode) {
            switch (mode) {
                case color_mode::always:
                    return true;
                case color_mode::never:
                    return false;
                case color_mode::automatic:
                    return ::isatty(STDOUT_FILENO) == 1;
            }
            return false;
        }

        static std::string_view status_color(reconcile_status status) {
            switch (status) {
                case reconcile_status::converged:
                    return "\x1b[32m"sv;
                case reconcile_status::exhausted:
                    return "\x1b[33m"sv;
                case reconcile_status::stalled:
                    return "\x1b[31m"sv;
                case reconcile_status::running:
                    break;
            }
            return ""sv;
        }

        static void print_records(
                std::string_view heading, const std::vector<failure_record>& records, bool verbose, std::ostream& os) {
            if (records.empty()) {
                return;
            }
            os << heading << " (" << records.size() << "):\n";
            for (size_t i = 0U; i < records.size(); ++i) {
                if (verbose) {
                    os << "  [" << (i + 1U) << "] expected:\n" << records[i].expected << '\n';
                    os << "  [" << (i + 1U) << "] actual:\n" << records[i].actual << '\n';
                }
                else {
                    os << "  [" << (i + 1U) << "] " << preview(records[i].expected) << '\n';
                }
            }
        }

        static void print_iteration(const iteration_report& report, bool verbose, std::ostream& os) {
            os << "iteration " << report.iteration << ": failures=" << report.failure_count
               << " applied=" << report.applied_count << " unmatched=" << report.unmatched.size();
            if (report.progress) {
                os << " (delta " << (*report.progress > 0 ? "+" : "") << *report.progress << ')';
            }
            os << '\n';

            if (verbose) {
                for (const auto& edit : report.edits) {
                    os << "  edit [" << edit.strategy << '/' << to_string(edit.scope) << "] "
                       << preview(edit.search) << " -> " << preview(edit.replace) << '\n';
                }
                for (const auto& edit : report.skipped) {
                    os << "  skipped [" << edit.strategy << '/' << to_string(edit.scope) << "] "
                       << preview(edit.search) << '\n';
                }
            }
        }

        static edit_record to_edit_record(const edit_entry& edit) {
            return edit_record{
                    .strategy = edit.strategy,
                    .scope = std::string(to_string(edit.scope)),
                    .search = edit.search,
                    .replace = edit.replace};
        }

        static reconcile_report make_report(const reconcile_outcome& outcome) {
            reconcile_report report{};
            report.status = std::string(to_string(outcome.status()));
            report.iterations = outcome.session.iteration;
            report.remaining_failures = outcome.remaining_failures();

            for (const auto& iteration : outcome.iterations) {
                iteration_record record{};
                record.iteration = iteration.iteration;
                record.failures = iteration.failure_count;
                record.applied = iteration.applied_count;
                record.harness_exit_code = iteration.harness_exit_code;
                record.progress = iteration.progress;
                record.unrecognized_failures = iteration.unrecognized_failures;
                record.unmatched = iteration.unmatched;
                for (const auto& edit : iteration.edits) {
                    record.edits.push_back(to_edit_record(edit));
                }
                for (const auto& edit : iteration.skipped) {
                    record.skipped.push_back(to_edit_record(edit));
                }
                report.history.push_back(std::move(record));
            }

            if (auto* last = outcome.last()) {
                report.remaining = last->remaining;
            }
            return report;
        }

        static void render_outcome_json(const reconcile_outcome& outcome, std::ostream& os) {
            auto report = make_report(outcome);
            std::string json{};
            auto ec = glz::write_json(report, json);
            if (ec) {
                throw std::runtime_error("failed to serialize reconcile report");
            }
            os << json << '\n';
        }

        static void render_outcome_table(const reconcile_outcome& outcome, const reconcile_config& cfg, std::ostream& os) {
            const auto* last = outcome.last();
            if (last) {
                if (outcome.status() == reconcile_status::stalled) {
                    print_records("unmatched failures", last->unmatched, cfg.verbose, os);
                }
                else if (outcome.status() == reconcile_status::exhausted) {
                    print_records("remaining failures", last->remaining, cfg.verbose, os);
                }
            }

            auto color = color_enabled(cfg.color);
            os << "status: ";
            if (color) {
                os << status_color(outcome.status());
            }
            os << to_string(outcome.status());
            if (color) {
                os << "\x1b[0m";
            }
            os << " iterations=" << outcome.session.iteration << " remaining=" << outcome.remaining_failures() << '\n';
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

    }  // namespace detail

    void apply_config_file(const std::filesystem::path& path, reconcile_config& cfg) {
        auto data = detail::read_json_file<detail::persisted_config>(path);
        detail::validate_supported_schema_version(data.schema_version, path);

        if (data.fixture) {
            cfg.fixture_path = *data.fixture;
        }
        if (data.harness) {
            if (data.harness->empty()) {
                throw std::runtime_error("empty harness command in {}"_format(path.string()));
            }
            cfg.harness_command = *data.harness;
        }
        if (data.filter_flag) {
            cfg.filter_flag = *data.filter_flag;
        }
        if (data.filter) {
            cfg.filter = *data.filter;
        }
        if (data.working_dir) {
            cfg.working_dir = *data.working_dir;
        }
        if (data.max_iterations) {
            if (*data.max_iterations < 1) {
                throw std::runtime_error("invalid max_iterations in {}: {}"_format(path.string(), *data.max_iterations));
            }
            cfg.max_iterations = *data.max_iterations;
        }
        if (data.section_marker) {
            cfg.section_marker = *data.section_marker;
        }
        if (data.failure_word) {
            cfg.failure_word = *data.failure_word;
        }
        if (data.numeric_labels) {
            cfg.numeric_labels = *data.numeric_labels;
        }
        if (data.context_radius) {
            if (*data.context_radius < 0) {
                throw std::runtime_error("invalid context_radius in {}: {}"_format(path.string(), *data.context_radius));
            }
            cfg.context_radius = static_cast<size_t>(*data.context_radius);
        }
        if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
            throw std::runtime_error("invalid output in {}: {}"_format(path.string(), *data.output));
        }
        if (data.color && !try_parse_color_mode(*data.color, cfg.color)) {
            throw std::runtime_error("invalid color in {}: {}"_format(path.string(), *data.color));
        }

        cfg.config_file = path;
    }

    void print_config(const reconcile_config& cfg, std::ostream& os) {
        os << "fixture=" << (cfg.fixture_path.empty() ? "<unset>" : cfg.fixture_path.string()) << '\n';
        os << "harness=" << utils::join_with_separator(cfg.harness_command, " "sv) << '\n';
        os << "filter_flag=" << cfg.filter_flag << '\n';
        os << "filter=" << (cfg.filter.empty() ? "<none>" : cfg.filter) << '\n';
        os << "working_dir=" << cfg.working_dir.string() << '\n';
        os << "max_iterations=" << cfg.max_iterations << '\n';
        os << "section_marker=" << cfg.section_marker << '\n';
        os << "failure_word=" << cfg.failure_word << '\n';
        os << "numeric_labels=" << utils::join_with_separator(cfg.numeric_labels, ","sv) << '\n';
        os << "context_radius=" << cfg.context_radius << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "color=" << to_string(cfg.color) << '\n';
        os << "config=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
    }

    int exit_code_for(reconcile_status status) {
        switch (status) {
            case reconcile_status::converged:
                return 0;
            case reconcile_status::stalled:
                return exit_stalled;
            case reconcile_status::exhausted:
                return exit_exhausted;
            case reconcile_status::running:
                break;
        }
        return 1;
    }

    void render_outcome(const reconcile_outcome& outcome, const reconcile_config& cfg, std::ostream& os) {
        if (cfg.output == output_mode::json) {
            detail::render_outcome_json(outcome, os);
            return;
        }
        detail::render_outcome_table(outcome, cfg, os);
    }

    int run(const reconcile_config& cfg, const harness_fn& harness) {
        auto options = make_reconcile_options(cfg);
        auto table = cfg.output == output_mode::table;

        auto observer = [&cfg, table](const iteration_report& report) {
            if (report.unrecognized_failures) {
                std::cerr << "warning: harness output contains '" << cfg.failure_word
                          << "' but no failure section was recognized\n";
            }
            if (table && !cfg.quiet) {
                detail::print_iteration(report, cfg.verbose, std::cout);
            }
        };

        auto outcome = run_reconciliation(options, cfg.max_iterations, harness, observer);
        render_outcome(outcome, cfg, std::cout);
        return exit_code_for(outcome.status());
    }

    int run_main(int argc, char** argv, const harness_fn& harness) {
        try {
            reconcile_config cfg{};
            if (auto cli_result = parse_cli(argc, argv, cfg)) {
                return *cli_result;
            }

            return run(cfg, harness);
        } catch (const std::exception& e) {
            std::cerr << "fatal: " << e.what() << '\n';
            return 1;
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, reconcile_config& cfg) {
        CLI::App app{"plansync: rewrite expected-value literals to match test harness output"};

        bool show_version = false;
        std::string fixture_arg{};
        std::string harness_arg{};
        std::vector<std::string> command_args{};
        std::string filter_arg{};
        std::string filter_flag_arg{cfg.filter_flag};
        std::string workdir_arg{cfg.working_dir.string()};
        int max_iterations_arg{cfg.max_iterations};
        std::string marker_arg{cfg.section_marker};
        std::string failure_word_arg{cfg.failure_word};
        std::vector<std::string> numeric_label_args{};
        int context_radius_arg{static_cast<int>(cfg.context_radius)};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        std::string config_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-f,--fixture", fixture_arg, "Fixture source file holding expected literals");
        app.add_option("--harness", harness_arg, "Harness command line, split on whitespace");
        app.add_option("command", command_args, "Harness argv (after --)");
        app.add_option("--filter", filter_arg, "Test-selection filter passed to the harness");
        app.add_option("--filter-flag", filter_flag_arg, "Flag placed before the filter");
        app.add_option("-C,--workdir", workdir_arg, "Working directory for the harness");
        app.add_option("-n,--max-iterations", max_iterations_arg, "Harness invocations before giving up");
        app.add_option("--marker", marker_arg, "Failure section marker");
        app.add_option("--failure-word", failure_word_arg, "Word signalling a failed harness run");
        app.add_option("--numeric-label", numeric_label_args, "Prefix of a patchable numeric value (repeatable)");
        app.add_option("--context-radius", context_radius_arg, "Context lines around a differing line");
        app.add_option("--config", config_arg, "JSON config file");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress per-iteration progress");
        app.add_flag("--verbose", cfg.verbose, "Print edits and full unmatched values");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "plansync 0.1.0\n";
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{exit_usage};
        }

        if (auto config_path = detail::normalize_optional(config_arg)) {
            try {
                apply_config_file(*config_path, cfg);
            } catch (const std::exception& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{exit_usage};
            }
        }

        if (app.count("--fixture") > 0U) {
            cfg.fixture_path = fixture_arg;
        }
        if (!command_args.empty()) {
            cfg.harness_command = command_args;
        }
        else if (app.count("--harness") > 0U) {
            auto tokens = utils::split_whitespace(harness_arg);
            if (tokens.empty()) {
                std::cerr << "invalid --harness value: command is empty\n";
                return std::optional<int>{exit_usage};
            }
            cfg.harness_command = std::move(tokens);
        }
        if (app.count("--filter") > 0U) {
            cfg.filter = filter_arg;
        }
        if (app.count("--filter-flag") > 0U) {
            cfg.filter_flag = filter_flag_arg;
        }
        if (app.count("--workdir") > 0U) {
            cfg.working_dir = workdir_arg;
        }
        if (app.count("--max-iterations") > 0U) {
            if (max_iterations_arg < 1) {
                std::cerr << "invalid --max-iterations value: " << max_iterations_arg << " (expected >= 1)\n";
                return std::optional<int>{exit_usage};
            }
            cfg.max_iterations = max_iterations_arg;
        }
        if (app.count("--marker") > 0U) {
            if (marker_arg.empty()) {
                std::cerr << "invalid --marker value: marker is empty\n";
                return std::optional<int>{exit_usage};
            }
            cfg.section_marker = marker_arg;
        }
        if (app.count("--failure-word") > 0U) {
            cfg.failure_word = failure_word_arg;
        }
        if (!numeric_label_args.empty()) {
            cfg.numeric_labels = numeric_label_args;
        }
        if (app.count("--context-radius") > 0U) {
            if (context_radius_arg < 0) {
                std::cerr << "invalid --context-radius value: " << context_radius_arg << " (expected >= 0)\n";
                return std::optional<int>{exit_usage};
            }
            cfg.context_radius = static_cast<size_t>(context_radius_arg);
        }
        if (app.count("--output") > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{exit_usage};
        }
        if (app.count("--color") > 0U && !try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{exit_usage};
        }

        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.fixture_path.empty()) {
            std::cerr << "a fixture file is required (--fixture or \"fixture\" in --config)\n";
            return std::optional<int>{exit_usage};
        }

        return std::nullopt;
    }

}  // namespace plansync::cli
