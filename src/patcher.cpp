#include "plansync/patcher.hpp"

#include "plansync/format.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace plansync::literals;

namespace plansync {

    namespace detail {

        static constexpr auto temp_suffix = ".plansync.tmp"sv;

        static size_t replace_first(std::string& text, std::string_view search, std::string_view replace) {
            auto pos = text.find(search);
            if (pos == std::string::npos) {
                return 0U;
            }
            text.replace(pos, search.size(), replace);
            return 1U;
        }

        static size_t replace_all(std::string& text, std::string_view search, std::string_view replace) {
            size_t count = 0U;
            auto pos = text.find(search);
            while (pos != std::string::npos) {
                text.replace(pos, search.size(), replace);
                ++count;
                pos = text.find(search, pos + replace.size());
            }
            return count;
        }

        static fs::path temp_path_for(const fs::path& path) {
            auto temp = path;
            temp += temp_suffix;
            return temp;
        }

    }  // namespace detail

    patch_result apply_edits(std::string_view content, const std::vector<edit_entry>& edits) {
        patch_result result{};
        result.content = std::string(content);

        for (const auto& edit : edits) {
            if (edit.search.empty()) {
                result.skipped.push_back(edit);
                continue;
            }

            size_t replaced = 0U;
            switch (edit.scope) {
                case edit_scope::first_occurrence:
                    replaced = detail::replace_first(result.content, edit.search, edit.replace);
                    break;
                case edit_scope::global:
                    replaced = detail::replace_all(result.content, edit.search, edit.replace);
                    break;
            }

            if (replaced == 0U) {
                debug_log("skipping ", edit.strategy, " edit; search text is no longer present");
                result.skipped.push_back(edit);
                continue;
            }
            ++result.applied_count;
            result.applied.push_back(edit);
        }

        return result;
    }

    fixture_file read_fixture(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open fixture: {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read fixture: {}"_format(path.string()));
        }
        return fixture_file{.path = path, .content = ss.str()};
    }

    void persist_fixture(const fixture_file& fixture) {
        auto temp = detail::temp_path_for(fixture.path);

        {
            std::ofstream out{temp, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open file for write: {}"_format(temp.string()));
            }
            out << fixture.content;
            out.flush();
            if (!out) {
                std::error_code ignored{};
                fs::remove(temp, ignored);
                throw std::runtime_error("failed to write file: {}"_format(temp.string()));
            }
        }

        std::error_code ec{};
        fs::rename(temp, fixture.path, ec);
        if (ec) {
            std::error_code ignored{};
            fs::remove(temp, ignored);
            throw std::runtime_error(
                    "failed to replace fixture {}: {}"_format(fixture.path.string(), ec.message()));
        }
    }

}  // namespace plansync
