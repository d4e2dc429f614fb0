#pragma once

#include <algorithm>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plansync {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        // Splits on '\n' and keeps a trailing empty line, so joining with '\n' is lossless
        inline std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            size_t cursor = 0U;
            while (true) {
                auto line_end = text.find('\n', cursor);
                if (line_end == std::string_view::npos) {
                    lines.push_back(text.substr(cursor));
                    break;
                }
                lines.push_back(text.substr(cursor, line_end - cursor));
                cursor = line_end + 1U;
            }
            return lines;
        }

        inline std::vector<std::string> split_whitespace(std::string_view text) {
            std::vector<std::string> tokens{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto first = text.find_first_not_of(" \t\r\n", cursor);
                if (first == std::string_view::npos) {
                    break;
                }
                auto last = text.find_first_of(" \t\r\n", first);
                if (last == std::string_view::npos) {
                    last = text.size();
                }
                tokens.emplace_back(text.substr(first, last - first));
                cursor = last;
            }
            return tokens;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        inline std::string join_with_separator(
                const std::vector<std::string_view>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace plansync
