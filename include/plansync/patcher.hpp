#pragma once

#include "strategy.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace plansync {

    struct fixture_file {
        std::filesystem::path path{};
        std::string content{};
    };

    struct patch_result {
        std::string content{};
        size_t applied_count{};
        std::vector<edit_entry> applied{};
        std::vector<edit_entry> skipped{};
    };

    // Edits apply in order to one working copy; an edit whose search text is absent is skipped
    patch_result apply_edits(std::string_view content, const std::vector<edit_entry>& edits);

    fixture_file read_fixture(const std::filesystem::path& path);

    // Writes a sibling temporary file and renames it over the fixture
    void persist_fixture(const fixture_file& fixture);

}  // namespace plansync
