#include "utils.hpp"

namespace plansync::test {
    using namespace std::string_view_literals;

    namespace detail {
        static std::string plan_fixture(std::string_view expected_plan) {
            std::string out{"var PlanTests = []QueryPlanTest{\n\t{\n\t\tQuery: `select * from xy`,\n\t\tExpectedPlan: "};
            out += quote_literal(expected_plan);
            out += ",\n\t},\n}\n";
            return out;
        }
    }  // namespace detail

    TEST_CASE("005: exact literal match replaces the first occurrence only", "[005][strategy][exact]") {
        auto content = R"(a := "a\nb"
b := "a\nb"
)"sv;
        auto record = failure_record{.expected = "a\nb", .actual = "a\nc"};

        auto edits = match_exact_literal(record, content, match_options{});
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].search == R"("a\nb")");
        CHECK(edits[0].replace == R"("a\nc")");
        CHECK(edits[0].scope == edit_scope::first_occurrence);
        CHECK(edits[0].strategy == "exact_literal");

        auto patched = apply_edits(content, edits);
        CHECK(patched.applied_count == 1U);
        CHECK(patched.content == "a := \"a\\nc\"\nb := \"a\\nb\"\n");
    }

    TEST_CASE("005: exact literal match on a single literal", "[005][strategy][exact]") {
        auto content = std::string{R"(x := "a\nb")"};
        auto record = failure_record{.expected = "a\nb", .actual = "a\nc"};

        auto patched = apply_edits(content, locate_edits(record, content, match_options{}));
        CHECK(patched.content.find(R"("a\nc")") != std::string::npos);
        CHECK(patched.content.find(R"("a\nb")") == std::string::npos);
    }

    TEST_CASE("005: exact literal needs the whole quoted literal", "[005][strategy][exact]") {
        auto content = R"(x := "a\nb\nextra")"sv;
        auto record = failure_record{.expected = "a\nb", .actual = "a\nc"};
        CHECK(match_exact_literal(record, content, match_options{}).empty());
    }

    TEST_CASE("005: identical expected and actual never produce edits", "[005][strategy]") {
        auto content = R"(x := "same")"sv;
        auto record = failure_record{.expected = "same", .actual = "same"};
        CHECK(locate_edits(record, content, match_options{}).empty());
    }

    TEST_CASE("005: numeric tokenizer", "[005][strategy][numeric]") {
        CHECK(numeric::number_length("12.5)"sv) == 4U);
        CHECK(numeric::number_length("-3"sv) == 2U);
        CHECK(numeric::number_length("1e+06 rows"sv) == 5U);
        CHECK(numeric::number_length("7."sv) == 1U);
        CHECK(numeric::number_length(".5"sv) == 2U);
        CHECK(numeric::number_length("abc"sv) == 0U);
        CHECK(numeric::number_length("-"sv) == 0U);

        auto tokens = numeric::tokenize("Scan(estimated cost=12.5, rows=3)"sv, default_numeric_labels());
        CHECK(tokens.skeleton == "Scan(estimated cost=#, rows=#)");
        REQUIRE(tokens.values.size() == 2U);
        CHECK(tokens.values[0].label == "estimated cost=");
        CHECK(tokens.values[0].value == "12.5");
        CHECK(tokens.values[1].label == "rows=");
        CHECK(tokens.values[1].value == "3");
    }

    TEST_CASE("005: numeric field match patches only the value, globally", "[005][strategy][numeric]") {
        // the surrounding literal drifted too, so an exact match is impossible
        auto content = detail::plan_fixture("Project\n └─ Scan(estimated cost=12.5)\n    └─ Table(xy)\n") +
                       "// shared: estimated cost=12.5\n";
        auto record = failure_record{
                .expected = "Project\n └─ Scan(estimated cost=12.5)\n    └─ Table(old)\n",
                .actual = "Project\n └─ Scan(estimated cost=14.0)\n    └─ Table(old)\n"};

        CHECK(match_exact_literal(record, content, match_options{}).empty());

        auto edits = locate_edits(record, content, match_options{});
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].strategy == "numeric_field");
        CHECK(edits[0].search == "estimated cost=12.5");
        CHECK(edits[0].replace == "estimated cost=14.0");
        CHECK(edits[0].scope == edit_scope::global);

        auto patched = apply_edits(content, edits);
        CHECK(patched.applied_count == 1U);
        CHECK(detail::count_occurrences(patched.content, "estimated cost=14.0"sv) == 2U);
        CHECK(patched.content.find("estimated cost=12.5") == std::string::npos);
        CHECK(patched.content.find("Table(xy)") != std::string::npos);
    }

    TEST_CASE("005: numeric field match rejects structural differences", "[005][strategy][numeric]") {
        auto content = "Scan(cost=1.5)"sv;
        auto record = failure_record{.expected = "Scan(cost=1.5)", .actual = "Lookup(cost=2.5)"};
        CHECK(match_numeric_field(record, content, match_options{}).empty());
    }

    TEST_CASE("005: numeric field match rejects prefixes of longer numbers", "[005][strategy][numeric]") {
        auto content = "a(cost=1) b(cost=12)"sv;
        auto record = failure_record{.expected = "x(cost=1)", .actual = "x(cost=2)"};
        CHECK(match_numeric_field(record, content, match_options{}).empty());
    }

    TEST_CASE("005: numeric field match leaves longer labels and words alone", "[005][strategy][numeric]") {
        SECTION("a shorter label inside a longer one") {
            auto content = "a := \"Scan(cost=3.5)\\nTable(xy)\"\nb := \"Join(estimated cost=3.5)\\nTable(uv)\"\n"sv;
            auto record = failure_record{
                    .expected = "Scan(cost=3.5)\nTable(stale)", .actual = "Scan(cost=4.0)\nTable(stale)"};
            CHECK(match_numeric_field(record, content, match_options{}).empty());
        }

        SECTION("a label that is the tail of a longer word") {
            auto content = "x(rows=5) y(maxrows=5)"sv;
            auto record = failure_record{.expected = "x(rows=5)", .actual = "x(rows=6)"};
            CHECK(match_numeric_field(record, content, match_options{}).empty());
        }

        SECTION("a field right after an escaped newline still matches") {
            auto content = "\"Project\\nrows=5\""sv;
            auto record = failure_record{.expected = "Other\nrows=5", .actual = "Other\nrows=6"};
            auto edits = match_numeric_field(record, content, match_options{});
            REQUIRE(edits.size() == 1U);
            CHECK(edits[0].search == "rows=5");
            CHECK(edits[0].replace == "rows=6");
        }
    }

    TEST_CASE("005: numeric field match rejects ambiguous and chained values", "[005][strategy][numeric]") {
        SECTION("one old value mapped to two new values") {
            auto content = "cost=1 cost=1"sv;
            auto record = failure_record{.expected = "cost=1 cost=1", .actual = "cost=2 cost=3"};
            CHECK(match_numeric_field(record, content, match_options{}).empty());
        }

        SECTION("a replacement that is another search text") {
            auto content = "cost=1 cost=2"sv;
            auto record = failure_record{.expected = "cost=1 cost=2", .actual = "cost=2 cost=3"};
            CHECK(match_numeric_field(record, content, match_options{}).empty());
        }
    }

    TEST_CASE("005: numeric field match drops values absent from the fixture", "[005][strategy][numeric]") {
        auto content = "rows=10"sv;
        auto record = failure_record{.expected = "rows=10 cost=3", .actual = "rows=11 cost=4"};
        auto edits = match_numeric_field(record, content, match_options{});
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].search == "rows=10");
        CHECK(edits[0].replace == "rows=11");
    }

    TEST_CASE("005: numeric field match honors configured labels", "[005][strategy][numeric]") {
        auto content = "latency_ms=40"sv;
        auto record = failure_record{.expected = "latency_ms=40", .actual = "latency_ms=45"};
        CHECK(match_numeric_field(record, content, match_options{}).empty());

        auto options = match_options{.numeric_labels = {"latency_ms="}};
        auto edits = match_numeric_field(record, content, options);
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].replace == "latency_ms=45");
    }

    TEST_CASE("005: context block replaces the window around a renamed node", "[005][strategy][context]") {
        auto fixture_plan = "Project\n"
                            " ├─ columns: [xy.x]\n"
                            " └─ Filter(xy.x > 1)\n"
                            "     └─ HashJoin(xy.y = uv.v)\n"
                            "         ├─ Table(xy)\n"
                            "         └─ Table(uv)\n";
        auto content = detail::plan_fixture(fixture_plan);

        // the harness saw a stale first line too, so neither exact nor numeric can match
        auto record = failure_record{
                .expected = "Project(old)\n"
                            " ├─ columns: [xy.x]\n"
                            " └─ Filter(xy.x > 1)\n"
                            "     └─ HashJoin(xy.y = uv.v)\n"
                            "         ├─ Table(xy)\n"
                            "         └─ Table(uv)\n",
                .actual = "Project(old)\n"
                          " ├─ columns: [xy.x]\n"
                          " └─ Filter(xy.x > 1)\n"
                          "     └─ LookupJoin(xy.y = uv.v)\n"
                          "         ├─ Table(xy)\n"
                          "         └─ Table(uv)\n"};

        auto edits = locate_edits(record, content, match_options{});
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].strategy == "context_block");
        CHECK(edits[0].scope == edit_scope::first_occurrence);
        CHECK(edits[0].search == encode_literal(" ├─ columns: [xy.x]\n"
                                                " └─ Filter(xy.x > 1)\n"
                                                "     └─ HashJoin(xy.y = uv.v)\n"
                                                "         ├─ Table(xy)\n"
                                                "         └─ Table(uv)"));

        auto patched = apply_edits(content, edits);
        REQUIRE(patched.applied_count == 1U);
        CHECK(patched.content.find("HashJoin") == std::string::npos);
        CHECK(patched.content.find(quote_literal("Project\n"
                                                 " ├─ columns: [xy.x]\n"
                                                 " └─ Filter(xy.x > 1)\n"
                                                 "     └─ LookupJoin(xy.y = uv.v)\n"
                                                 "         ├─ Table(xy)\n"
                                                 "         └─ Table(uv)\n")) != std::string::npos);
    }

    TEST_CASE("005: context block merges overlapping windows", "[005][strategy][context]") {
        auto content = R"("l0\nl1\nA\nl3\nB\nl5\nl6\nl7\nl8\nl9\nC\nl11")"sv;
        auto record = failure_record{
                .expected = "l0\nl1\nA\nl3\nB\nl5\nl6\nl7\nl8\nl9\nC\nl11",
                .actual = "l0\nl1\nA2\nl3\nB2\nl5\nl6\nl7\nl8\nl9\nC2\nl11"};

        auto edits = match_context_block(record, content, match_options{});
        REQUIRE(edits.size() == 2U);
        // lines 2 and 4 share the window [0, 6]; line 10 gets [8, 11]
        CHECK(edits[0].search == R"(l0\nl1\nA\nl3\nB\nl5\nl6)");
        CHECK(edits[0].replace == R"(l0\nl1\nA2\nl3\nB2\nl5\nl6)");
        CHECK(edits[1].search == R"(l8\nl9\nC\nl11)");

        auto patched = apply_edits(content, edits);
        CHECK(patched.applied_count == 2U);
        CHECK(patched.content == R"("l0\nl1\nA2\nl3\nB2\nl5\nl6\nl7\nl8\nl9\nC2\nl11")");
    }

    TEST_CASE("005: context block skips windows missing from the fixture", "[005][strategy][context]") {
        auto content = R"("l0\nl1\nA\nl3\nl4\nl5\nl6\nB\nl8")"sv;
        auto record = failure_record{
                .expected = "stale\nl1\nA\nl3\nl4\nl5\nl6\nB\nl8",
                .actual = "stale\nl1\nA2\nl3\nl4\nl5\nl6\nB2\nl8"};

        auto edits = match_context_block(record, content, match_options{});
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].search == R"(l5\nl6\nB\nl8)");
    }

    TEST_CASE("005: context block with a narrower radius", "[005][strategy][context]") {
        auto content = R"("x0\nl1\nA\nl3\nl4")"sv;
        auto record = failure_record{.expected = "x0\nl1\nA\nl3\nl4", .actual = "x0\nl1\nB\nl3\nl4"};
        // exact wins here, so call the context matcher directly
        auto edits = match_context_block(record, content, match_options{.context_radius = 1U});
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].search == R"(l1\nA\nl3)");
        CHECK(edits[0].replace == R"(l1\nB\nl3)");
    }

    TEST_CASE("005: context block needs matching line counts and an anchor", "[005][strategy][context]") {
        auto content = R"("a\nb\nc")"sv;
        CHECK(match_context_block(failure_record{.expected = "a\nb\nc", .actual = "a\nb"}, content, match_options{})
                      .empty());
        CHECK(match_context_block(failure_record{.expected = "a\nq\nc", .actual = "a\nr\nc"}, content, match_options{})
                      .empty());
    }

    TEST_CASE("005: unmatched records are reported by the edit plan", "[005][strategy][plan]") {
        auto content = std::string{R"(p := "a\nb")"};
        auto records = std::vector<failure_record>{
                failure_record{.expected = "a\nb", .actual = "a\nc"},
                failure_record{.expected = "nowhere", .actual = "to be found"},
        };

        auto plan = build_edit_plan(records, content, match_options{});
        REQUIRE(plan.edits.size() == 1U);
        CHECK(plan.edits[0].strategy == "exact_literal");
        REQUIRE(plan.unmatched.size() == 1U);
        CHECK(plan.unmatched[0].expected == "nowhere");
    }

    TEST_CASE("005: conflicting global edits across records", "[005][strategy][plan]") {
        auto content = std::string{"a(cost=1) b(cost=2) c(cost=5)"};
        auto records = std::vector<failure_record>{
                failure_record{.expected = "a(cost=1)x", .actual = "a(cost=2)x"},
                failure_record{.expected = "b(cost=2)x", .actual = "b(cost=3)x"},
                failure_record{.expected = "c(cost=5)x", .actual = "c(cost=6)x"},
                failure_record{.expected = "c(cost=5)y", .actual = "c(cost=6)y"},
        };

        auto plan = build_edit_plan(records, content, match_options{});
        REQUIRE(plan.edits.size() == 2U);
        CHECK(plan.edits[0].search == "cost=1");
        CHECK(plan.edits[1].search == "cost=5");
        REQUIRE(plan.unmatched.size() == 1U);
        CHECK(plan.unmatched[0].expected == "b(cost=2)x");
    }

    TEST_CASE("005: custom strategy chains stop at the first success", "[005][strategy]") {
        int second_calls = 0;
        auto strategies = std::vector<match_strategy>{
                match_strategy{
                        .name = "always",
                        .match = [](const failure_record&, std::string_view, const match_options&) {
                            return std::vector<edit_entry>{edit_entry{.search = "x", .replace = "y", .strategy = "always"}};
                        }},
                match_strategy{
                        .name = "never_reached",
                        .match = [&second_calls](const failure_record&, std::string_view, const match_options&) {
                            ++second_calls;
                            return std::vector<edit_entry>{};
                        }},
        };

        auto edits = locate_edits(failure_record{.expected = "x", .actual = "y"}, "x"sv, match_options{}, strategies);
        REQUIRE(edits.size() == 1U);
        CHECK(edits[0].strategy == "always");
        CHECK(second_calls == 0);
    }
}  // namespace plansync::test
