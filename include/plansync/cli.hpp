#pragma once

#include "config.hpp"
#include "harness.hpp"
#include "reconcile.hpp"

#include <filesystem>
#include <optional>
#include <ostream>

namespace plansync::cli {

    inline constexpr int exit_usage = 2;
    inline constexpr int exit_stalled = 3;
    inline constexpr int exit_exhausted = 4;

    // Returns an exit code for one-shot exits and usage errors, nullopt to continue
    std::optional<int> parse_cli(int argc, char** argv, reconcile_config& cfg);

    // Merges a JSON config file into `cfg`; throws on unreadable or invalid files
    void apply_config_file(const std::filesystem::path& path, reconcile_config& cfg);

    void print_config(const reconcile_config& cfg, std::ostream& os);

    int exit_code_for(reconcile_status status);

    void render_outcome(const reconcile_outcome& outcome, const reconcile_config& cfg, std::ostream& os);

    int run(const reconcile_config& cfg, const harness_fn& harness = run_process_harness);

    // Process entry point: parse, run, and turn escaping exceptions into "fatal:" with exit code 1
    int run_main(int argc, char** argv, const harness_fn& harness = run_process_harness);

}  // namespace plansync::cli
