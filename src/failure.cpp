#include "plansync/failure.hpp"

#include "plansync/literal.hpp"

namespace plansync {

    namespace detail {

        static constexpr bool is_blank(char c) {
            return c == ' ' || c == '\t';
        }

        static constexpr bool is_space(char c) {
            return is_blank(c) || c == '\r' || c == '\n';
        }

        // `open` indexes the opening quote; returns the index of the matching unescaped closing quote
        static std::optional<size_t> find_closing_quote(std::string_view text, size_t open) {
            for (size_t i = open + 1U; i < text.size(); ++i) {
                if (text[i] == '\\') {
                    ++i;
                    continue;
                }
                if (text[i] == '"') {
                    return i;
                }
            }
            return std::nullopt;
        }

        static std::vector<std::string_view> split_sections(std::string_view output, std::string_view marker) {
            std::vector<std::string_view> sections{};
            if (marker.empty()) {
                sections.push_back(output);
                return sections;
            }

            size_t cursor = 0U;
            while (true) {
                auto pos = output.find(marker, cursor);
                if (pos == std::string_view::npos) {
                    sections.push_back(output.substr(cursor));
                    break;
                }
                sections.push_back(output.substr(cursor, pos - cursor));
                cursor = pos + marker.size();
            }
            return sections;
        }

    }  // namespace detail

    std::optional<labeled_literal> find_labeled_literal(std::string_view section, std::string_view label, size_t from) {
        if (label.empty()) {
            return std::nullopt;
        }

        for (auto pos = section.find(label, from); pos != std::string_view::npos;
             pos = section.find(label, pos + 1U)) {
            auto i = pos + label.size();
            while (i < section.size() && detail::is_blank(section[i])) {
                ++i;
            }
            if (i >= section.size() || section[i] != ':') {
                continue;
            }
            ++i;
            while (i < section.size() && detail::is_space(section[i])) {
                ++i;
            }
            if (i >= section.size() || section[i] != '"') {
                continue;
            }

            auto close = detail::find_closing_quote(section, i);
            if (!close) {
                return std::nullopt;
            }
            return labeled_literal{.body = section.substr(i + 1U, *close - i - 1U), .end = *close + 1U};
        }
        return std::nullopt;
    }

    std::vector<failure_record> parse_failures(std::string_view output, const failure_parse_options& options) {
        std::vector<failure_record> records{};

        auto sections = detail::split_sections(output, options.section_marker);
        for (size_t i = 1U; i < sections.size(); ++i) {
            auto section = sections[i];

            auto expected = find_labeled_literal(section, options.expected_label);
            if (!expected) {
                debug_log("section ", i, ": no expected literal, skipping");
                continue;
            }
            auto actual = find_labeled_literal(section, options.actual_label, expected->end);
            if (!actual) {
                debug_log("section ", i, ": no actual literal, skipping");
                continue;
            }

            records.push_back(
                    failure_record{.expected = decode_literal(expected->body), .actual = decode_literal(actual->body)});
        }

        return records;
    }

    bool output_reports_failure(std::string_view output, std::string_view failure_word) {
        return !failure_word.empty() && output.find(failure_word) != std::string_view::npos;
    }

}  // namespace plansync
