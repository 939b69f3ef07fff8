#include "irdiverge/analyzer.hpp"

#include "irdiverge/align.hpp"
#include "irdiverge/divergence.hpp"
#include "irdiverge/errors.hpp"
#include "irdiverge/extract.hpp"
#include "irdiverge/headers.hpp"
#include "irdiverge/mapping.hpp"

#include <fstream>
#include <future>
#include <sstream>

using namespace irdiverge::literals;

namespace irdiverge {

    namespace fs = std::filesystem;

    namespace detail {

        struct pipeline_input {
            std::string_view label{};
            fs::path dump_path{};
            dump_dialect dialect{dump_dialect::legacy};
            fs::path extract_dir{};
        };

        static void require_input(const fs::path& path, std::string_view what) {
            std::error_code ec{};
            if (!fs::is_regular_file(path, ec)) {
                throw missing_input("{} file not found: {}"_format(what, path.string()));
            }
        }

        static std::string read_dump(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw missing_input("failed to open dump: {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (in.bad()) {
                throw missing_input("failed to read dump: {}"_format(path.string()));
            }
            return ss.str();
        }

        static std::vector<pass_record> scan_and_extract(const pipeline_input& input, run_log& log) {
            auto text = read_dump(input.dump_path);
            auto headers = scan_headers(text, input.dialect);
            log.info("{}: found {} pass headers in {}"_format(input.label, headers.size(), input.dump_path.string()));

            directory_store store{input.extract_dir};
            auto records = extract(text, headers, store);
            for (const auto& record : records) {
                log.debug("{}: extracted #{} {} -> {}"_format(
                        input.label, record.sequence_index, record.canonical_name, record.content.location.string()));
            }
            return records;
        }

        static void log_alignment(const alignment_result& alignment, run_log& log) {
            log.info("aligned {} pass pairs, {} unmatched"_format(alignment.pairs.size(), alignment.unmatched.size()));
            for (const auto& entry : alignment.unmatched) {
                if (entry.target) {
                    log.warning("unmatched pass #{} {} -> {} ({})"_format(
                            entry.record.sequence_index, entry.record.canonical_name, *entry.target, entry.reason));
                }
                else {
                    log.warning("unmatched pass #{} {} ({})"_format(
                            entry.record.sequence_index, entry.record.canonical_name, entry.reason));
                }
            }
            for (const auto& target : alignment.ambiguous_targets) {
                log.warning("ambiguous mapping: multiple legacy passes map to {}"_format(target));
            }
        }

    }  // namespace detail

    output_layout make_output_layout(const fs::path& root) {
        return output_layout{
                .root = root,
                .extracted_a = root / "extracted" / "legacy",
                .extracted_b = root / "extracted" / "npm",
                .analysis = root / "analysis",
                .logs = root / "logs"};
    }

    void prepare_output_layout(const output_layout& layout) {
        for (const auto* dir : {&layout.extracted_a, &layout.extracted_b, &layout.analysis, &layout.logs}) {
            std::error_code ec{};
            fs::create_directories(*dir, ec);
            if (ec) {
                throw storage_fault("failed to create directory {}: {}"_format(dir->string(), ec.message()));
            }
        }
    }

    fs::path archive_output_dir(std::string_view name, std::chrono::system_clock::time_point when) {
        return fs::path{"output"} / "archive" / "{}_{}"_format(name, format_local_time("%Y%m%d_%H%M%S", when));
    }

    bool has_previous_results(const output_layout& layout) {
        std::error_code ec{};
        auto extracted = layout.root / "extracted";
        if (!fs::is_directory(extracted, ec)) {
            return false;
        }
        auto it = fs::recursive_directory_iterator{extracted, ec};
        if (ec) {
            return false;
        }
        for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (ec) {
                return false;
            }
            if (it->is_regular_file(ec)) {
                return true;
            }
        }
        return false;
    }

    void remove_previous_results(const output_layout& layout) {
        for (const auto& dir : {layout.root / "extracted", layout.analysis, layout.logs}) {
            std::error_code ec{};
            fs::remove_all(dir, ec);
            if (ec) {
                throw storage_fault("failed to remove {}: {}"_format(dir.string(), ec.message()));
            }
        }
    }

    analysis_report run_analysis(const analysis_config& cfg, run_log& log) {
        detail::require_input(cfg.legacy_path, "legacy dump"sv);
        detail::require_input(cfg.npm_path, "npm dump"sv);
        detail::require_input(cfg.mapping_path, "pass mapping"sv);

        auto mapping = load_name_mapping(cfg.mapping_path);
        log.info("loaded {} pass mappings from {}"_format(mapping.size(), cfg.mapping_path.string()));

        auto layout = make_output_layout(cfg.output_dir);
        prepare_output_layout(layout);

        detail::pipeline_input a_input{
                .label = "legacy"sv,
                .dump_path = cfg.legacy_path,
                .dialect = cfg.legacy_dialect,
                .extract_dir = layout.extracted_a};
        detail::pipeline_input b_input{
                .label = "npm"sv, .dump_path = cfg.npm_path, .dialect = cfg.npm_dialect, .extract_dir = layout.extracted_b};

        auto a_future = std::async(std::launch::async, detail::scan_and_extract, std::cref(a_input), std::ref(log));
        auto b_future = std::async(std::launch::async, detail::scan_and_extract, std::cref(b_input), std::ref(log));

        // b_future's destructor joins its task if a_future rethrows
        auto a_passes = a_future.get();
        auto b_passes = b_future.get();

        auto alignment = align(a_passes, b_passes, mapping, cfg.exclusions);
        detail::log_alignment(alignment, log);

        directory_store a_store{layout.extracted_a};
        directory_store b_store{layout.extracted_b};
        auto divergence = find_first_divergence(alignment.pairs, cfg.normalization, a_store, b_store);
        if (divergence.found && divergence.pair) {
            log.info("first divergence at pair #{}: {} vs {}"_format(
                    divergence.index, divergence.pair->a.canonical_name, divergence.pair->b.canonical_name));
        }
        else {
            log.info("no divergence across {} compared pass pairs"_format(divergence.compared));
        }

        auto report = build_report(a_passes, b_passes, alignment, divergence);
        write_reports(
                report,
                report_paths{.analysis_dir = layout.analysis, .logs_dir = layout.logs},
                a_passes,
                b_passes,
                alignment,
                divergence);
        log.info("wrote report to {}"_format(report.output_files.json_report));

        return report;
    }

}  // namespace irdiverge
