#pragma once

#include "config.hpp"
#include "failure.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plansync {

    enum class edit_scope : uint8_t {
        first_occurrence,
        global,
    };

    inline constexpr std::string_view to_string(edit_scope scope) {
        switch (scope) {
            case edit_scope::first_occurrence:
                return "first"sv;
            case edit_scope::global:
                return "global"sv;
        }
        return "first"sv;
    }

    struct edit_entry {
        std::string search{};
        std::string replace{};
        edit_scope scope{edit_scope::first_occurrence};
        std::string strategy{};

        bool operator==(const edit_entry&) const = default;
    };

    struct match_options {
        std::vector<std::string> numeric_labels{default_numeric_labels()};
        size_t context_radius{default_context_radius};
    };

    // Pure matcher; an empty result means the record was not located in `content`
    using match_fn =
            std::function<std::vector<edit_entry>(const failure_record&, std::string_view, const match_options&)>;

    struct match_strategy {
        std::string name{};
        match_fn match{};
    };

    std::vector<edit_entry> match_exact_literal(
            const failure_record& record, std::string_view content, const match_options& options);

    std::vector<edit_entry> match_numeric_field(
            const failure_record& record, std::string_view content, const match_options& options);

    std::vector<edit_entry> match_context_block(
            const failure_record& record, std::string_view content, const match_options& options);

    // exact_literal, numeric_field, context_block
    const std::vector<match_strategy>& default_strategies();

    // First strategy with a non-empty result wins
    std::vector<edit_entry> locate_edits(
            const failure_record& record,
            std::string_view content,
            const match_options& options,
            const std::vector<match_strategy>& strategies = default_strategies());

    struct edit_plan {
        std::vector<edit_entry> edits{};
        std::vector<failure_record> unmatched{};
    };

    edit_plan build_edit_plan(
            const std::vector<failure_record>& records,
            std::string_view content,
            const match_options& options,
            const std::vector<match_strategy>& strategies = default_strategies());

    namespace numeric {

        struct labeled_value {
            std::string label{};
            std::string value{};
        };

        struct tokenized_text {
            // Text with every labeled number replaced by the label followed by '#'
            std::string skeleton{};
            std::vector<labeled_value> values{};
        };

        // Length of a decimal number (optional sign, fraction, exponent) at the start of `text`
        size_t number_length(std::string_view text);

        tokenized_text tokenize(std::string_view text, const std::vector<std::string>& labels);

    }  // namespace numeric

}  // namespace plansync
