#include "utils.hpp"

namespace irdiverge::test {

    namespace detail {
        static std::vector<pass_record> make_pipeline(memory_store& store,
                                                      std::string_view prefix,
                                                      const std::vector<std::string_view>& names) {
            std::vector<pass_record> records{};
            for (size_t i = 0U; i < names.size(); ++i) {
                records.push_back(
                        make_record(store, names[i], i, "ret void\n"sv, "{}_{:03}.ll"_format(prefix, i)));
            }
            return records;
        }

        static void check_monotonic(const alignment_result& result) {
            std::optional<size_t> last_b{};
            std::vector<size_t> seen{};
            for (const auto& pair : result.pairs) {
                if (last_b) {
                    CHECK(pair.b.sequence_index > *last_b);
                }
                CHECK(std::ranges::find(seen, pair.b.sequence_index) == seen.end());
                seen.push_back(pair.b.sequence_index);
                last_b = pair.b.sequence_index;
            }
        }
    }  // namespace detail

    TEST_CASE("005: mapping json parsing", "[005][mapping]") {
        auto mapping = parse_name_mapping(R"({"instcombine": "InstCombinePass", "early-cse": "EarlyCSEPass"})"sv);
        REQUIRE(mapping.size() == 2U);
        CHECK(mapping.at("instcombine") == "InstCombinePass");
        CHECK(mapping.at("early-cse") == "EarlyCSEPass");

        CHECK(parse_name_mapping("{}"sv).empty());
        CHECK_THROWS_AS(parse_name_mapping(R"({"a": 1})"sv), malformed_mapping);
        CHECK_THROWS_AS(parse_name_mapping(R"(["a", "b"])"sv), malformed_mapping);
        CHECK_THROWS_AS(parse_name_mapping(R"({"a": "b")"sv), malformed_mapping);
    }

    TEST_CASE("005: mapping file errors", "[005][mapping][errors]") {
        temp_dir dir{"irdiverge_005_mapping"};
        CHECK_THROWS_AS(load_name_mapping(dir.path / "absent.json"), missing_input);

        auto bad = dir.path / "bad.json";
        write_text_file(bad, "{\"a\": [1, 2]}");
        try {
            (void)load_name_mapping(bad);
            FAIL("expected malformed_mapping");
        } catch (const malformed_mapping& e) {
            CHECK(e.kind() == error_kind::malformed_mapping);
            CHECK(std::string_view{e.what()}.find(bad.string()) != std::string_view::npos);
        }

        auto good = dir.path / "good.json";
        write_text_file(good, R"({"sroa": "SROAPass"})");
        CHECK(load_name_mapping(good).at("sroa") == "SROAPass");
    }

    TEST_CASE("005: ambiguous targets", "[005][mapping]") {
        name_mapping mapping{
                {"a", "Shared"}, {"b", "Shared"}, {"c", "Unique"}, {"d", ""}, {"e", ""}, {"f", "Also"}, {"g", "Also"}};
        CHECK(find_ambiguous_targets(mapping) == std::vector<std::string>{"Also", "Shared"});
        CHECK(find_ambiguous_targets(name_mapping{{"a", "A"}}).empty());
    }

    TEST_CASE("005: greedy chronological alignment", "[005][align]") {
        memory_store store{};
        auto a = detail::make_pipeline(store, "a"sv, {"InstCombine"sv, "early-cse"sv});
        auto b = detail::make_pipeline(store, "b"sv, {"instcombine"sv, "simplifycfg"sv, "early-cse"sv});
        name_mapping mapping{{"InstCombine", "instcombine"}, {"early-cse", "early-cse"}};

        auto result = align(a, b, mapping, exclusion_set{});
        REQUIRE(result.pairs.size() == 2U);
        CHECK(result.pairs[0].a.sequence_index == 0U);
        CHECK(result.pairs[0].b.sequence_index == 0U);
        CHECK(result.pairs[1].a.sequence_index == 1U);
        CHECK(result.pairs[1].b.sequence_index == 2U);
        CHECK(result.unmatched.empty());
        CHECK(result.ambiguous_targets.empty());
        detail::check_monotonic(result);
    }

    TEST_CASE("005: alignment never moves backwards or reuses a pass", "[005][align]") {
        memory_store store{};
        auto a = detail::make_pipeline(store, "a"sv, {"x"sv, "y"sv, "x"sv, "x"sv, "z"sv});
        auto b = detail::make_pipeline(store, "b"sv, {"Y"sv, "X"sv, "Z"sv, "X"sv});
        name_mapping mapping{{"x", "X"}, {"y", "Y"}, {"z", "Z"}};

        auto result = align(a, b, mapping, exclusion_set{});
        detail::check_monotonic(result);

        // x@0 -> X@1; y@1 has no Y after 1; x@2 -> X@3; x@3 and z@4 find nothing after 3
        REQUIRE(result.pairs.size() == 2U);
        CHECK(result.pairs[0].a.sequence_index == 0U);
        CHECK(result.pairs[0].b.sequence_index == 1U);
        CHECK(result.pairs[1].a.sequence_index == 2U);
        CHECK(result.pairs[1].b.sequence_index == 3U);

        REQUIRE(result.unmatched.size() == 3U);
        for (const auto& entry : result.unmatched) {
            CHECK(entry.reason == unmatched_reason::no_chronological_match);
            CHECK(entry.target.has_value());
        }
        CHECK(result.unmatched[0].record.canonical_name == "y");
        CHECK(*result.unmatched[2].target == "Z");
    }

    TEST_CASE("005: unmapped and excluded passes", "[005][align]") {
        memory_store store{};
        auto a = detail::make_pipeline(store, "a"sv, {"verify"sv, "sroa"sv, "mystery"sv, "gvn"sv, "dce"sv});
        auto b = detail::make_pipeline(store, "b"sv, {"SROAPass"sv, "GVNPass"sv, "DCEPass"sv});
        name_mapping mapping{{"verify", "VerifierPass"}, {"sroa", "SROAPass"}, {"gvn", "GVNPass"}, {"dce", ""}};

        exclusion_set exclusions{};
        exclusions.exclude_a.insert("verify");
        exclusions.exclude_b.insert("GVNPass");

        auto result = align(a, b, mapping, exclusions);
        REQUIRE(result.pairs.size() == 1U);
        CHECK(result.pairs[0].a.canonical_name == "sroa");
        CHECK(result.pairs[0].b.canonical_name == "SROAPass");

        REQUIRE(result.unmatched.size() == 4U);
        CHECK(result.unmatched[0].record.canonical_name == "verify");
        CHECK(result.unmatched[0].reason == unmatched_reason::excluded_a);
        CHECK(result.unmatched[1].record.canonical_name == "mystery");
        CHECK(result.unmatched[1].reason == unmatched_reason::unmapped);
        CHECK_FALSE(result.unmatched[1].target.has_value());
        CHECK(result.unmatched[2].record.canonical_name == "gvn");
        CHECK(result.unmatched[2].reason == unmatched_reason::excluded_b);
        CHECK(*result.unmatched[2].target == "GVNPass");
        CHECK(result.unmatched[3].record.canonical_name == "dce");
        CHECK(result.unmatched[3].reason == unmatched_reason::unmapped);

        CHECK(to_string(unmatched_reason::no_chronological_match) == "no_chronological_match"sv);
    }

    TEST_CASE("005: ambiguity is reported but still aligned", "[005][align]") {
        memory_store store{};
        auto a = detail::make_pipeline(store, "a"sv, {"licm"sv, "loop-licm"sv});
        auto b = detail::make_pipeline(store, "b"sv, {"LICMPass"sv, "LICMPass"sv});
        name_mapping mapping{{"licm", "LICMPass"}, {"loop-licm", "LICMPass"}};

        auto result = align(a, b, mapping, exclusion_set{});
        CHECK(result.ambiguous_targets == std::vector<std::string>{"LICMPass"});
        REQUIRE(result.pairs.size() == 2U);
        CHECK(result.pairs[0].b.sequence_index == 0U);
        CHECK(result.pairs[1].b.sequence_index == 1U);
    }

}  // namespace irdiverge::test
