#pragma once

#include "plansync.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace plansync::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline size_t count_occurrences(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) {
            return 0U;
        }
        size_t count = 0U;
        for (auto pos = haystack.find(needle); pos != std::string_view::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            ++count;
        }
        return count;
    }

    // what() of the runtime_error `fn` throws; empty when it returns normally
    template <typename F>
    std::string runtime_error_message(F&& fn) {
        try {
            std::forward<F>(fn)();
        } catch (const std::runtime_error& e) {
            return e.what();
        }
        return {};
    }

    // One testify-style "Not equal" block as `go test` prints it
    inline std::string failure_section(std::string_view expected, std::string_view actual) {
        std::ostringstream out{};
        out << "        \tError Trace:\tplan_test.go:42\n";
        out << "        \tError:      \tNot equal: \n";
        out << "        \t            \texpected: " << quote_literal(expected) << '\n';
        out << "        \t            \tactual  : " << quote_literal(actual) << '\n';
        out << "        \tTest:       \tTestQueryPlans\n";
        return out.str();
    }

    inline std::string failing_run(const std::vector<failure_record>& failures) {
        std::ostringstream out{};
        out << "=== RUN   TestQueryPlans\n";
        for (const auto& failure : failures) {
            out << failure_section(failure.expected, failure.actual);
        }
        out << "--- FAIL: TestQueryPlans (0.01s)\n";
        out << "FAIL\n";
        return out.str();
    }

    inline std::string passing_run() {
        return "=== RUN   TestQueryPlans\n--- PASS: TestQueryPlans (0.01s)\nPASS\nok  \tenginetest\t0.02s\n";
    }

    // Replays canned outputs in order; the last one repeats once the script runs out
    struct scripted_harness {
        std::vector<std::string> outputs{};
        std::vector<harness_request> requests{};

        harness_result operator()(const harness_request& request) {
            requests.push_back(request);
            REQUIRE_FALSE(outputs.empty());
            auto index = std::min(requests.size() - 1U, outputs.size() - 1U);
            return harness_result{.exit_code = outputs[index].find("FAIL") == std::string::npos ? 0 : 1,
                                  .output = outputs[index]};
        }

        harness_fn fn() {
            return [this](const harness_request& request) { return (*this)(request); };
        }
    };
}  // namespace plansync::test::detail
