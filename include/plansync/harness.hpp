#pragma once

#include "config.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace plansync {

    struct harness_request {
        std::vector<std::string> command{};
        std::string filter_flag{};
        std::string filter{};
        std::filesystem::path working_dir{"."};
    };

    struct harness_result {
        int exit_code{};
        // stdout and stderr, interleaved as the child wrote them
        std::string output{};
    };

    using harness_fn = std::function<harness_result(const harness_request&)>;

    harness_request make_harness_request(const reconcile_config& cfg);

    std::vector<std::string> harness_argv(const harness_request& request);

    // Runs the harness as a child process and blocks until it exits
    harness_result run_process_harness(const harness_request& request);

}  // namespace plansync
