#include "utils.hpp"

namespace irdiverge::test {

    TEST_CASE("001: dump dialect parsing", "[001][config]") {
        dump_dialect dialect = dump_dialect::legacy;

        REQUIRE(try_parse_dump_dialect("NPM"sv, dialect));
        CHECK(dialect == dump_dialect::npm);
        REQUIRE(try_parse_dump_dialect("legacy"sv, dialect));
        CHECK(dialect == dump_dialect::legacy);
        REQUIRE(try_parse_dump_dialect("b"sv, dialect));
        CHECK(dialect == dump_dialect::npm);
        REQUIRE(try_parse_dump_dialect("A"sv, dialect));
        CHECK(dialect == dump_dialect::legacy);

        CHECK_FALSE(try_parse_dump_dialect("new"sv, dialect));
        CHECK(dialect == dump_dialect::legacy);

        CHECK(to_string(dump_dialect::legacy) == "legacy"sv);
        CHECK(to_string(dump_dialect::npm) == "npm"sv);
        CHECK("{}"_format(dump_dialect::npm) == "npm");
    }

    TEST_CASE("001: default config", "[001][config]") {
        analysis_config cfg{};

        CHECK(cfg.legacy_path == fs::path{"data/legacy.full.txt"});
        CHECK(cfg.npm_path == fs::path{"data/npm.full.txt"});
        CHECK(cfg.mapping_path == fs::path{"data/legacy-to-npm-pass-mapping.json"});
        CHECK(cfg.output_dir == fs::path{"output/current"});
        CHECK_FALSE(cfg.config_path.has_value());

        const auto& norm = cfg.normalization;
        CHECK(norm.drop_blank_lines);
        CHECK(norm.drop_metadata);
        CHECK_FALSE(norm.strip_comments);
        CHECK(norm.strip_debug_info);
        CHECK(norm.rename_temporaries);
        CHECK(norm.rename_labels);
        CHECK(norm.collapse_whitespace);
        CHECK(cfg.exclusions.exclude_a.empty());
        CHECK(cfg.exclusions.exclude_b.empty());
    }

    TEST_CASE("001: config file overrides only the keys it names", "[001][config]") {
        temp_dir dir{"irdiverge_001_config"};
        auto path = dir.path / "config.json";
        write_text_file(
                path,
                R"({
  "schema_version": 1,
  "normalization": {"strip_comments": true, "rename_labels": false},
  "exclude_a": ["Print Module IR", "verify"],
  "exclude_b": ["VerifierPass"],
  "comment": "unknown keys are ignored"
})");

        analysis_config cfg{};
        cfg.exclusions.exclude_a.insert("already-there");
        apply_config_file(path, cfg);

        CHECK(cfg.normalization.strip_comments);
        CHECK_FALSE(cfg.normalization.rename_labels);
        CHECK(cfg.normalization.rename_temporaries);
        CHECK(cfg.normalization.drop_metadata);

        CHECK(cfg.exclusions.exclude_a.contains("Print Module IR"));
        CHECK(cfg.exclusions.exclude_a.contains("verify"));
        CHECK(cfg.exclusions.exclude_a.contains("already-there"));
        CHECK(cfg.exclusions.exclude_b.contains("VerifierPass"));
        REQUIRE(cfg.config_path.has_value());
        CHECK(*cfg.config_path == path);
    }

    TEST_CASE("001: config file errors", "[001][config][errors]") {
        temp_dir dir{"irdiverge_001_config_errors"};
        analysis_config cfg{};

        CHECK_THROWS_AS(apply_config_file(dir.path / "absent.json", cfg), missing_input);

        auto garbage = dir.path / "garbage.json";
        write_text_file(garbage, "{ not json");
        CHECK_THROWS_AS(apply_config_file(garbage, cfg), invalid_config);

        auto future = dir.path / "future.json";
        write_text_file(future, R"({"schema_version": 2})");
        try {
            apply_config_file(future, cfg);
            FAIL("expected invalid_config");
        } catch (const analysis_error& e) {
            CHECK(e.kind() == error_kind::invalid_config);
            CHECK(std::string_view{e.what()}.find("schema_version") != std::string_view::npos);
        }
    }

    TEST_CASE("001: print_config lists resolved values", "[001][config]") {
        analysis_config cfg{};
        cfg.normalization.strip_comments = true;
        cfg.exclusions.exclude_a = {"b-pass", "a-pass"};

        std::ostringstream os{};
        print_config(cfg, os);
        auto text = os.str();

        CHECK(text.find("legacy=data/legacy.full.txt\n") != std::string::npos);
        CHECK(text.find("config=<none>\n") != std::string::npos);
        CHECK(text.find("npm_dialect=npm\n") != std::string::npos);
        CHECK(text.find("normalize.strip_comments=on\n") != std::string::npos);
        CHECK(text.find("normalize.drop_metadata=on\n") != std::string::npos);
        CHECK(text.find("exclude_legacy=a-pass,b-pass\n") != std::string::npos);
        CHECK(text.find("exclude_npm=\n") != std::string::npos);
    }

    TEST_CASE("001: error kinds", "[001][errors]") {
        CHECK(missing_input{"x"}.kind() == error_kind::missing_input);
        CHECK(malformed_mapping{"x"}.kind() == error_kind::malformed_mapping);
        CHECK(storage_fault{"x"}.kind() == error_kind::storage_fault);
        CHECK(invalid_config{"x"}.kind() == error_kind::invalid_config);

        CHECK(to_string(error_kind::storage_fault) == "storage_fault"sv);
        CHECK(std::string_view{storage_fault{"disk full"}.what()} == "disk full"sv);
    }

}  // namespace irdiverge::test
