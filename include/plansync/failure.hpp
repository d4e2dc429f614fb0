#pragma once

#include "config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plansync {

    struct failure_record {
        std::string expected{};
        std::string actual{};

        bool operator==(const failure_record&) const = default;
    };

    struct failure_parse_options {
        std::string section_marker{default_section_marker};
        std::string expected_label{"expected"};
        std::string actual_label{"actual"};
    };

    struct labeled_literal {
        std::string_view body{};  // still escaped, quotes stripped
        size_t end{};             // offset just past the closing quote
    };

    // Finds `label`, optional padding, ':' and a double-quoted literal at or after `from`
    std::optional<labeled_literal> find_labeled_literal(
            std::string_view section, std::string_view label, size_t from = 0U);

    std::vector<failure_record> parse_failures(std::string_view output, const failure_parse_options& options = {});

    bool output_reports_failure(std::string_view output, std::string_view failure_word);

}  // namespace plansync
