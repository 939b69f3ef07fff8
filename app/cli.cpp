#include "cli.hpp"

#include "irdiverge/errors.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace irdiverge::literals;

namespace irdiverge::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static bool confirm(std::string_view prompt) {
            std::cout << prompt << std::flush;
            std::string answer{};
            if (!std::getline(std::cin, answer)) {
                std::cout << '\n';
                return false;
            }
            auto value = utils::trim(answer);
            return utils::str_case_eq(value, "y"sv) || utils::str_case_eq(value, "yes"sv);
        }

        static void handle_previous_results(const output_layout& layout, const run_options& opts, bool quiet) {
            if (!has_previous_results(layout)) {
                return;
            }
            if (opts.no_cleanup) {
                if (!quiet) {
                    std::cout << "Skipping cleanup (--no-cleanup specified)\n";
                }
                return;
            }
            if (!confirm("Clean up previous results? (y/N): "sv)) {
                if (!quiet) {
                    std::cout << "Keeping previous results\n";
                }
                return;
            }
            remove_previous_results(layout);
            if (!quiet) {
                std::cout << "Cleanup completed\n";
            }
        }

        static void print_banner(const analysis_config& cfg, std::ostream& os) {
            os << "LLVM IR Divergence Analyzer\n";
            os << std::string(50U, '=') << '\n';
            os << "Legacy dump:  " << cfg.legacy_path.string() << '\n';
            os << "NPM dump:     " << cfg.npm_path.string() << '\n';
            os << "Pass mapping: " << cfg.mapping_path.string() << '\n';
            os << "Output dir:   " << cfg.output_dir.string() << "\n\n";
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, analysis_config& cfg, run_options& opts) {
        CLI::App app{"irdiverge: find where two LLVM pass pipelines first produce different IR"};

        bool show_version = false;
        std::string legacy_arg{cfg.legacy_path.string()};
        std::string npm_arg{cfg.npm_path.string()};
        std::string mapping_arg{cfg.mapping_path.string()};
        std::string config_arg{};
        std::string output_dir_arg{cfg.output_dir.string()};
        std::string archive_arg{};
        std::string legacy_dialect_arg{std::string{to_string(cfg.legacy_dialect)}};
        std::string npm_dialect_arg{std::string{to_string(cfg.npm_dialect)}};
        std::vector<std::string> exclude_legacy_args{};
        std::vector<std::string> exclude_npm_args{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--legacy", legacy_arg, "Legacy pass manager dump file");
        app.add_option("--npm", npm_arg, "New pass manager dump file");
        app.add_option("--mapping", mapping_arg, "Legacy-to-NPM pass mapping JSON file");
        app.add_option("--config", config_arg, "JSON config file (normalization flags, exclusions)");
        app.add_option("--output-dir", output_dir_arg, "Output directory for analysis results");
        app.add_option("--archive", archive_arg, "Write results to output/archive/<name>_<timestamp>");
        app.add_flag("--clean", opts.clean, "Remove previous results and exit");
        app.add_flag("--no-cleanup", opts.no_cleanup, "Keep previous results without prompting");
        app.add_option("--legacy-dialect", legacy_dialect_arg, "Banner dialect of the legacy dump: legacy|npm");
        app.add_option("--npm-dialect", npm_dialect_arg, "Banner dialect of the npm dump: legacy|npm");
        app.add_flag("--no-ignore-temp-vars", "Don't normalize temporary value names");
        app.add_flag("--no-ignore-labels", "Don't normalize basic block labels");
        app.add_flag("--no-ignore-metadata", "Keep metadata lines (starting with !)");
        app.add_flag("--ignore-comments", "Strip ';' comments");
        app.add_option("--exclude-legacy", exclude_legacy_args, "Legacy pass names never aligned")->delimiter(',');
        app.add_option("--exclude-npm", exclude_npm_args, "NPM pass names never aligned")->delimiter(',');
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("-v,--verbose", cfg.verbose, "Echo the run log to stderr");
        app.add_flag("-q,--quiet", cfg.quiet, "Suppress progress and summary output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // --help and --help-all exit 0, every other parse error is a usage error
            auto code = app.exit(e);
            return std::optional<int>{code == 0 ? 0 : 2};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            std::cout << "irdiverge 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!try_parse_dump_dialect(legacy_dialect_arg, cfg.legacy_dialect)) {
            std::cerr << "invalid --legacy-dialect value: " << legacy_dialect_arg << " (expected legacy|npm)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_dump_dialect(npm_dialect_arg, cfg.npm_dialect)) {
            std::cerr << "invalid --npm-dialect value: " << npm_dialect_arg << " (expected legacy|npm)\n";
            return std::optional<int>{2};
        }

        cfg.legacy_path = legacy_arg;
        cfg.npm_path = npm_arg;
        cfg.mapping_path = mapping_arg;
        cfg.output_dir = output_dir_arg;

        if (!archive_arg.empty()) {
            opts.archive = archive_arg;
            cfg.output_dir = archive_output_dir(archive_arg);
        }

        // config file first, explicit flags override it
        if (!config_arg.empty()) {
            apply_config_file(config_arg, cfg);
        }

        if (app.get_option("--no-ignore-temp-vars")->count() > 0U) {
            cfg.normalization.rename_temporaries = false;
        }
        if (app.get_option("--no-ignore-labels")->count() > 0U) {
            cfg.normalization.rename_labels = false;
        }
        if (app.get_option("--no-ignore-metadata")->count() > 0U) {
            cfg.normalization.drop_metadata = false;
        }
        if (app.get_option("--ignore-comments")->count() > 0U) {
            cfg.normalization.strip_comments = true;
        }
        cfg.exclusions.exclude_a.insert(exclude_legacy_args.begin(), exclude_legacy_args.end());
        cfg.exclusions.exclude_b.insert(exclude_npm_args.begin(), exclude_npm_args.end());

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run(analysis_config& cfg, const run_options& opts) {
        auto layout = make_output_layout(cfg.output_dir);

        if (opts.clean) {
            remove_previous_results(layout);
            if (!cfg.quiet) {
                std::cout << "Cleanup completed\n";
            }
            return 0;
        }

        if (!cfg.quiet) {
            if (opts.archive) {
                std::cout << "Archiving results to: " << cfg.output_dir.string() << '\n';
            }
            else {
                std::cout << "Output directory: " << cfg.output_dir.string() << '\n';
            }
        }

        detail::handle_previous_results(layout, opts, cfg.quiet);

        if (!cfg.quiet) {
            detail::print_banner(cfg, std::cout);
        }

        prepare_output_layout(layout);

        run_log log{};
        log.open_file(layout.logs / "analyzer.log");
        log.set_echo(cfg.verbose);

        try {
            auto report = run_analysis(cfg, log);
            if (!cfg.quiet) {
                print_summary(report, std::cout);
            }
            return report.success ? 0 : 1;
        } catch (const analysis_error& e) {
            log.error("{}: {}"_format(e.kind(), e.what()));
            throw;
        }
    }

}  // namespace irdiverge::cli
