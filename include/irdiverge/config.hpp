#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace irdiverge {

    using namespace std::string_view_literals;

    /*
     * irdiverge Run Config Options
     *
     * Inputs
     * - legacy_path: Pipeline A dump (legacy pass manager, -print-after-all output).
     * - npm_path: Pipeline B dump (new pass manager, -print-after-all output).
     * - mapping_path: JSON object mapping pipeline A pass names to pipeline B pass names.
     * - config_path: Optional JSON config file; flags given on the command line win.
     * - legacy_dialect/npm_dialect: Banner dialect recognized in each dump.
     *
     * Output
     * - output_dir: Run directory; receives extracted/, analysis/ and logs/.
     * - verbose: Echo the run log to stderr.
     * - quiet: Suppress the terminal summary and progress lines.
     *
     * Normalization (see normalize.hpp for the exact rewrite rules)
     * - drop_blank_lines: Drop lines that are empty or whitespace only.
     * - drop_metadata: Drop lines starting with '!'.
     * - strip_comments: Remove ';' comment suffixes.
     * - strip_debug_info: Remove ", !dbg !N" attachments.
     * - rename_temporaries: Rename %values to %temp_N in first-seen order.
     * - rename_labels: Rename block labels and their references to label_N.
     * - collapse_whitespace: Collapse whitespace runs and trim each line.
     *
     * Alignment
     * - exclude_a: Pipeline A pass names never aligned.
     * - exclude_b: Pipeline B pass names never aligned.
     *
     * Introspection flags
     * - print_config: Print the resolved config and exit.
     */

    enum class dump_dialect : uint8_t { legacy, npm };

    inline constexpr std::string_view to_string(dump_dialect dialect) {
        switch (dialect) {
            case dump_dialect::legacy:
                return "legacy"sv;
            case dump_dialect::npm:
                return "npm"sv;
        }
        return "legacy"sv;
    }

    inline constexpr bool try_parse_dump_dialect(std::string_view text, dump_dialect& out) {
        if (utils::str_case_eq(text, "legacy"sv) || utils::str_case_eq(text, "a"sv)) {
            out = dump_dialect::legacy;
            return true;
        }
        if (utils::str_case_eq(text, "npm"sv) || utils::str_case_eq(text, "b"sv)) {
            out = dump_dialect::npm;
            return true;
        }
        return false;
    }

    struct normalize_options {
        bool drop_blank_lines{true};
        bool drop_metadata{true};
        bool strip_comments{false};
        bool strip_debug_info{true};
        bool rename_temporaries{true};
        bool rename_labels{true};
        bool collapse_whitespace{true};

        bool operator==(const normalize_options&) const = default;
    };

    struct exclusion_set {
        std::unordered_set<std::string> exclude_a{};
        std::unordered_set<std::string> exclude_b{};
    };

    struct analysis_config {
        std::filesystem::path legacy_path{"data/legacy.full.txt"};
        std::filesystem::path npm_path{"data/npm.full.txt"};
        std::filesystem::path mapping_path{"data/legacy-to-npm-pass-mapping.json"};
        std::optional<std::filesystem::path> config_path{};
        dump_dialect legacy_dialect{dump_dialect::legacy};
        dump_dialect npm_dialect{dump_dialect::npm};

        std::filesystem::path output_dir{"output/current"};
        bool verbose{false};
        bool quiet{false};

        normalize_options normalization{};
        exclusion_set exclusions{};

        bool print_config{false};
    };

    // Reads a JSON config file and applies its normalization flags and exclusion lists onto `cfg`.
    // Throws missing_input if the file cannot be read and invalid_config if it cannot be parsed.
    void apply_config_file(const std::filesystem::path& path, analysis_config& cfg);

    void print_config(const analysis_config& cfg, std::ostream& os);

}  // namespace irdiverge
