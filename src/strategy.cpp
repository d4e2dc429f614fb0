#include "plansync/strategy.hpp"

#include "plansync/literal.hpp"
#include "plansync/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace plansync {

    namespace detail {

        static constexpr auto exact_literal_name = "exact_literal"sv;
        static constexpr auto numeric_field_name = "numeric_field"sv;
        static constexpr auto context_block_name = "context_block"sv;

        static bool is_word_char(char c) {
            return utils::is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        // True when `content` ends at `pos` with a configured label longer than `label` that ends in `label`
        static bool inside_longer_label(
                std::string_view content, size_t pos, std::string_view label, const std::vector<std::string>& labels) {
            return std::ranges::any_of(labels, [&](const std::string& other) {
                auto encoded = encode_literal(other);
                if (encoded.size() <= label.size() || !std::string_view{encoded}.ends_with(label)) {
                    return false;
                }
                auto lead = encoded.size() - label.size();
                return pos >= lead && content.substr(pos - lead, encoded.size()) == encoded;
            });
        }

        // Every occurrence of `search` must be a whole labeled field: not the tail of a longer word or label,
        // and not the prefix of a longer number
        static bool occurs_only_as_field(
                std::string_view content,
                std::string_view search,
                std::string_view label,
                const std::vector<std::string>& labels) {
            for (auto pos = content.find(search); pos != std::string_view::npos; pos = content.find(search, pos + 1U)) {
                // an escape such as \n ends the previous line, not a word
                auto escaped = pos > 1U && content[pos - 2U] == '\\';
                if (pos > 0U && is_word_char(content[pos - 1U]) && !escaped) {
                    return false;
                }
                if (inside_longer_label(content, pos, label, labels)) {
                    return false;
                }
                auto next = content.substr(pos + search.size());
                if (!next.empty() && utils::is_digit(next.front())) {
                    return false;
                }
                if (next.size() > 1U && next[0] == '.' && utils::is_digit(next[1])) {
                    return false;
                }
            }
            return true;
        }

        struct line_window {
            size_t first{};
            size_t last{};
        };

        static std::string join_window(const std::vector<std::string_view>& lines, const line_window& window) {
            std::vector<std::string_view> slice(
                    lines.begin() + static_cast<std::ptrdiff_t>(window.first),
                    lines.begin() + static_cast<std::ptrdiff_t>(window.last) + 1);
            return utils::join_with_separator(slice, "\n"sv);
        }

        static bool conflicts_with(const edit_entry& candidate, const std::vector<edit_entry>& accepted) {
            if (candidate.scope != edit_scope::global) {
                return false;
            }
            return std::ranges::any_of(accepted, [&candidate](const edit_entry& other) {
                if (other.scope != edit_scope::global) {
                    return false;
                }
                if (other.search == candidate.search) {
                    return other.replace != candidate.replace;
                }
                return other.replace == candidate.search || candidate.replace == other.search;
            });
        }

    }  // namespace detail

    namespace numeric {

        size_t number_length(std::string_view text) {
            size_t i = 0U;
            if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
                ++i;
            }

            auto digits_start = i;
            while (i < text.size() && utils::is_digit(text[i])) {
                ++i;
            }
            auto int_digits = i - digits_start;

            size_t frac_digits = 0U;
            if (i < text.size() && text[i] == '.') {
                auto frac_start = i + 1U;
                auto j = frac_start;
                while (j < text.size() && utils::is_digit(text[j])) {
                    ++j;
                }
                frac_digits = j - frac_start;
                if (frac_digits > 0U) {
                    i = j;
                }
            }

            if (int_digits == 0U && frac_digits == 0U) {
                return 0U;
            }

            if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
                auto j = i + 1U;
                if (j < text.size() && (text[j] == '-' || text[j] == '+')) {
                    ++j;
                }
                auto exp_start = j;
                while (j < text.size() && utils::is_digit(text[j])) {
                    ++j;
                }
                if (j > exp_start) {
                    i = j;
                }
            }

            return i;
        }

        tokenized_text tokenize(std::string_view text, const std::vector<std::string>& labels) {
            tokenized_text out{};
            out.skeleton.reserve(text.size());

            size_t i = 0U;
            while (i < text.size()) {
                auto rest = text.substr(i);
                const std::string* best = nullptr;
                size_t best_number = 0U;
                for (const auto& label : labels) {
                    if (label.empty() || !rest.starts_with(label)) {
                        continue;
                    }
                    if (best && best->size() >= label.size()) {
                        continue;
                    }
                    auto n = number_length(rest.substr(label.size()));
                    if (n > 0U) {
                        best = &label;
                        best_number = n;
                    }
                }

                if (!best) {
                    out.skeleton += text[i];
                    ++i;
                    continue;
                }

                out.skeleton += *best;
                out.skeleton += '#';
                out.values.push_back(
                        labeled_value{.label = *best, .value = std::string(rest.substr(best->size(), best_number))});
                i += best->size() + best_number;
            }

            return out;
        }

    }  // namespace numeric

    std::vector<edit_entry> match_exact_literal(
            const failure_record& record, std::string_view content, const match_options&) {
        if (record.expected == record.actual) {
            return {};
        }

        auto search = quote_literal(record.expected);
        if (content.find(search) == std::string_view::npos) {
            return {};
        }

        return {edit_entry{
                .search = std::move(search),
                .replace = quote_literal(record.actual),
                .scope = edit_scope::first_occurrence,
                .strategy = std::string(detail::exact_literal_name)}};
    }

    std::vector<edit_entry> match_numeric_field(
            const failure_record& record, std::string_view content, const match_options& options) {
        if (record.expected == record.actual || options.numeric_labels.empty()) {
            return {};
        }

        auto expected = numeric::tokenize(record.expected, options.numeric_labels);
        auto actual = numeric::tokenize(record.actual, options.numeric_labels);
        if (expected.skeleton != actual.skeleton || expected.values.size() != actual.values.size()) {
            return {};
        }

        std::vector<edit_entry> edits{};
        for (size_t i = 0U; i < expected.values.size(); ++i) {
            const auto& before = expected.values[i];
            const auto& after = actual.values[i];
            if (before.value == after.value) {
                continue;
            }

            auto search = encode_literal(before.label + before.value);
            auto replace = encode_literal(after.label + after.value);

            if (!detail::occurs_only_as_field(content, search, encode_literal(before.label), options.numeric_labels)) {
                debug_log("numeric_field: ", search, " also occurs outside its own field");
                return {};
            }

            auto existing = std::ranges::find(edits, search, &edit_entry::search);
            if (existing != edits.end()) {
                if (existing->replace != replace) {
                    debug_log("numeric_field: ", search, " maps to more than one value");
                    return {};
                }
                continue;
            }

            edits.push_back(edit_entry{
                    .search = std::move(search),
                    .replace = std::move(replace),
                    .scope = edit_scope::global,
                    .strategy = std::string(detail::numeric_field_name)});
        }

        for (const auto& edit : edits) {
            if (std::ranges::find(edits, edit.replace, &edit_entry::search) != edits.end()) {
                debug_log("numeric_field: chained substitution on ", edit.replace);
                return {};
            }
        }

        std::erase_if(
                edits, [content](const edit_entry& edit) { return content.find(edit.search) == std::string_view::npos; });
        return edits;
    }

    std::vector<edit_entry> match_context_block(
            const failure_record& record, std::string_view content, const match_options& options) {
        if (record.expected == record.actual) {
            return {};
        }

        auto expected_lines = utils::split_lines(record.expected);
        auto actual_lines = utils::split_lines(record.actual);
        if (expected_lines.size() != actual_lines.size()) {
            return {};
        }

        auto radius = options.context_radius;
        auto last_line = expected_lines.size() - 1U;

        std::vector<detail::line_window> windows{};
        for (size_t d = 0U; d < expected_lines.size(); ++d) {
            if (expected_lines[d] == actual_lines[d]) {
                continue;
            }

            auto anchor = encode_literal(expected_lines[d]);
            if (anchor.empty() || content.find(anchor) == std::string_view::npos) {
                continue;
            }

            detail::line_window window{.first = d > radius ? d - radius : 0U, .last = std::min(d + radius, last_line)};
            if (!windows.empty() && window.first <= windows.back().last) {
                windows.back().last = std::max(windows.back().last, window.last);
            }
            else {
                windows.push_back(window);
            }
        }

        std::vector<edit_entry> edits{};
        for (const auto& window : windows) {
            auto search = encode_literal(detail::join_window(expected_lines, window));
            auto replace = encode_literal(detail::join_window(actual_lines, window));
            if (search == replace || content.find(search) == std::string_view::npos) {
                continue;
            }
            edits.push_back(edit_entry{
                    .search = std::move(search),
                    .replace = std::move(replace),
                    .scope = edit_scope::first_occurrence,
                    .strategy = std::string(detail::context_block_name)});
        }

        return edits;
    }

    const std::vector<match_strategy>& default_strategies() {
        static const std::vector<match_strategy> strategies{
                match_strategy{.name = std::string(detail::exact_literal_name), .match = match_exact_literal},
                match_strategy{.name = std::string(detail::numeric_field_name), .match = match_numeric_field},
                match_strategy{.name = std::string(detail::context_block_name), .match = match_context_block},
        };
        return strategies;
    }

    std::vector<edit_entry> locate_edits(
            const failure_record& record,
            std::string_view content,
            const match_options& options,
            const std::vector<match_strategy>& strategies) {
        for (const auto& strategy : strategies) {
            auto edits = strategy.match(record, content, options);
            if (!edits.empty()) {
                debug_log("located ", edits.size(), " edit(s) via ", strategy.name);
                return edits;
            }
        }
        return {};
    }

    edit_plan build_edit_plan(
            const std::vector<failure_record>& records,
            std::string_view content,
            const match_options& options,
            const std::vector<match_strategy>& strategies) {
        edit_plan plan{};

        for (const auto& record : records) {
            auto edits = locate_edits(record, content, options, strategies);
            if (edits.empty()) {
                plan.unmatched.push_back(record);
                continue;
            }

            auto conflicting = std::ranges::any_of(
                    edits, [&plan](const edit_entry& edit) { return detail::conflicts_with(edit, plan.edits); });
            if (conflicting) {
                debug_log("dropping record whose global edit conflicts with an earlier one");
                plan.unmatched.push_back(record);
                continue;
            }

            for (auto& edit : edits) {
                if (edit.scope == edit_scope::global && std::ranges::find(plan.edits, edit) != plan.edits.end()) {
                    continue;
                }
                plan.edits.push_back(std::move(edit));
            }
        }

        return plan;
    }

}  // namespace plansync
