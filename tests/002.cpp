#include "utils.hpp"

namespace irdiverge::test {

    TEST_CASE("002: legacy banners", "[002][headers]") {
        auto header = match_header("*** IR Dump After Combine redundant instructions (instcombine) ***"sv,
                                   dump_dialect::legacy,
                                   7U);
        REQUIRE(header.has_value());
        CHECK(header->canonical_name == "instcombine");
        CHECK(header->scope == pass_scope::unknown);
        CHECK_FALSE(header->target.has_value());
        CHECK(header->line_number == 7U);

        auto plain = match_header("*** IR Dump After Module Verifier ***"sv, dump_dialect::legacy, 1U);
        REQUIRE(plain.has_value());
        CHECK(plain->canonical_name == "Module Verifier");

        auto hashed = match_header("  # *** IR Dump After Early CSE (early-cse) ***   "sv, dump_dialect::legacy, 2U);
        REQUIRE(hashed.has_value());
        CHECK(hashed->canonical_name == "early-cse");
        CHECK(hashed->line_text == "  # *** IR Dump After Early CSE (early-cse) ***");

        CHECK_FALSE(match_header("*** IR Dump After ***"sv, dump_dialect::legacy, 3U).has_value());
        CHECK_FALSE(match_header("*** IR Dump After Early CSE"sv, dump_dialect::legacy, 3U).has_value());
        CHECK_FALSE(match_header("; *** IR Dump After InstCombinePass on foo ***"sv, dump_dialect::legacy, 3U)
                            .has_value());
        CHECK_FALSE(match_header("define void @f() {"sv, dump_dialect::legacy, 3U).has_value());
    }

    TEST_CASE("002: last parenthesized group", "[002][headers]") {
        CHECK(last_parenthesized_group("Instrument function entry/exit (post inlining) (post-inline-ee-instrument)"sv) ==
              "post-inline-ee-instrument");
        CHECK(last_parenthesized_group("Dead Code Elimination"sv) == "Dead Code Elimination");
        CHECK(last_parenthesized_group("Odd () name"sv) == "Odd () name");
        CHECK(last_parenthesized_group("Spaces (   )"sv).empty());
        CHECK(last_parenthesized_group("Named (gvn) (  )"sv).empty());
        CHECK(last_parenthesized_group("(early-cse)"sv) == "early-cse");
    }

    TEST_CASE("002: npm banners", "[002][headers]") {
        auto function_pass = match_header("; *** IR Dump After InstCombinePass on main ***"sv, dump_dialect::npm, 4U);
        REQUIRE(function_pass.has_value());
        CHECK(function_pass->canonical_name == "InstCombinePass");
        CHECK(function_pass->scope == pass_scope::function);
        REQUIRE(function_pass->target.has_value());
        CHECK(*function_pass->target == "main");

        auto module_pass = match_header("; *** IR Dump After GlobalOptPass on [module] ***"sv, dump_dialect::npm, 5U);
        REQUIRE(module_pass.has_value());
        CHECK(module_pass->canonical_name == "GlobalOptPass");
        CHECK(module_pass->scope == pass_scope::module);
        CHECK_FALSE(module_pass->target.has_value());

        auto spaced = match_header(
                "; *** IR Dump After PassManager<Function> on (anonymous namespace)::f ***"sv, dump_dialect::npm, 6U);
        REQUIRE(spaced.has_value());
        CHECK(spaced->canonical_name == "PassManager<Function>");
        CHECK(*spaced->target == "(anonymous namespace)::f");

        CHECK_FALSE(match_header("; *** IR Dump After InstCombinePass ***"sv, dump_dialect::npm, 7U).has_value());
        CHECK_FALSE(match_header("*** IR Dump After InstCombinePass on main ***"sv, dump_dialect::npm, 7U).has_value());
    }

    TEST_CASE("002: scanning yields headers in discovery order", "[002][headers]") {
        constexpr auto dump = R"(; ModuleID = 'x.c'
*** IR Dump After Pass One (one) ***
define i32 @f() {
  ret i32 0
}
*** IR Dump After Pass Two (two) ***
define i32 @f() {
  ret i32 0
}

*** IR Dump After Pass Three (three) ***
)"sv;

        auto headers = scan_headers(dump, dump_dialect::legacy);
        REQUIRE(headers.size() == 3U);
        CHECK(headers[0].canonical_name == "one");
        CHECK(headers[1].canonical_name == "two");
        CHECK(headers[2].canonical_name == "three");
        CHECK(headers[0].line_number == 2U);
        CHECK(headers[1].line_number == 6U);
        CHECK(headers[2].line_number == 11U);
        for (size_t i = 1U; i < headers.size(); ++i) {
            CHECK(headers[i - 1U].line_number < headers[i].line_number);
        }

        std::istringstream in{std::string{dump}};
        auto streamed = scan_headers(in, dump_dialect::legacy);
        REQUIRE(streamed.size() == headers.size());
        for (size_t i = 0U; i < headers.size(); ++i) {
            CHECK(streamed[i].canonical_name == headers[i].canonical_name);
            CHECK(streamed[i].line_number == headers[i].line_number);
        }

        CHECK(scan_headers(dump, dump_dialect::npm).empty());
        CHECK(scan_headers(""sv, dump_dialect::legacy).empty());
    }

}  // namespace irdiverge::test
