#include "irdiverge/report.hpp"

#include "internal/types.hpp"
#include "irdiverge/diff.hpp"
#include "irdiverge/errors.hpp"
#include "irdiverge/log.hpp"

#include <fstream>
#include <set>
#include <sstream>

using namespace irdiverge::literals;

namespace irdiverge {

    namespace fs = std::filesystem;

    namespace detail {

        inline constexpr auto report_json_opts = glz::opts{.skip_null_members = false, .prettify = true};

        inline constexpr size_t visualization_width = 120U;
        inline constexpr size_t visualization_left_width = 50U;
        inline constexpr size_t visualization_arrow_width = 7U;
        inline constexpr size_t visualization_header_width = 60U;

        inline constexpr auto arrow_mapped = " <---> "sv;
        inline constexpr auto arrow_divergent = " <-D-> "sv;

        static report_pass_pair make_pass_pair(size_t index, const alignment_pair& pair) {
            return report_pass_pair{
                    .index = index,
                    .a_pass = pair.a.canonical_name,
                    .b_pass = pair.b.canonical_name,
                    .a_file = pair.a.content.location.string(),
                    .b_file = pair.b.content.location.string(),
                    .a_position = pair.a.sequence_index,
                    .b_position = pair.b.sequence_index};
        }

        template <typename T>
        static std::string serialize_report_json(const T& payload) {
            std::string json{};
            auto ec = glz::write<report_json_opts>(payload, json);
            if (ec) {
                throw std::runtime_error("failed to serialize json payload");
            }
            return json;
        }

        static void write_text_file(const fs::path& path, std::string_view text) {
            std::ofstream out{path};
            if (!out) {
                throw storage_fault("failed to open file for write: {}"_format(path.string()));
            }
            out << text;
            if (!out) {
                throw storage_fault("failed to write file: {}"_format(path.string()));
            }
        }

        static std::string pass_cell(const pass_record& record) {
            return "(#{:3}) {}"_format(record.sequence_index, record.canonical_name);
        }

        struct visualization_row {
            std::string left{};
            std::string_view arrow{};
            std::string right{};
        };

        static std::string render_row(const visualization_row& row) {
            auto line = "{:<{}}{:<{}}{}"_format(
                    row.left, visualization_left_width, row.arrow, visualization_arrow_width, row.right);
            return std::string{utils::trim_right(line)};
        }

    }  // namespace detail

    double mapping_success_rate(size_t matched, size_t unmatched) {
        auto total = matched + unmatched;
        if (total == 0U) {
            return 0.0;
        }
        return static_cast<double>(matched) / static_cast<double>(total);
    }

    analysis_report build_report(const std::vector<pass_record>& a_passes,
                                 const std::vector<pass_record>& b_passes,
                                 const alignment_result& alignment,
                                 const divergence_result& divergence) {
        analysis_report report{};
        report.analysis_info.timestamp = format_local_time("%Y-%m-%dT%H:%M:%S");

        auto matched = alignment.pairs.size();
        auto unmatched_a = alignment.unmatched.size();

        report.summary = report_summary{
                .total_a_passes = a_passes.size(),
                .total_b_passes = b_passes.size(),
                .successfully_mapped = matched,
                .unmatched_a_passes = unmatched_a,
                .unused_b_passes = b_passes.size() - matched};

        auto& div = report.divergence_analysis;
        div.total_compared_passes = divergence.compared;
        if (divergence.found && divergence.pair) {
            div.divergence_found = true;
            div.first_divergent_pass = detail::make_pass_pair(divergence.index, *divergence.pair);
            if (divergence.last_common_pair) {
                div.last_common_pass = detail::make_pass_pair(divergence.index - 1U, *divergence.last_common_pair);
            }
            div.passes_compared_before_divergence = divergence.index;
        }
        else {
            div.message = std::string{"No divergence found in any mapped passes"};
        }

        auto& details = report.mapping_details;
        details.successful_mappings.reserve(matched);
        for (size_t i = 0U; i < alignment.pairs.size(); ++i) {
            const auto& pair = alignment.pairs[i];
            details.successful_mappings.push_back(report_mapping_entry{
                    .pair_index = i,
                    .a_pass = pair.a.canonical_name,
                    .b_pass = pair.b.canonical_name,
                    .a_file = pair.a.content.location.string(),
                    .b_file = pair.b.content.location.string()});
        }
        details.unmatched_passes.reserve(unmatched_a);
        for (const auto& entry : alignment.unmatched) {
            details.unmatched_passes.push_back(report_unmatched_entry{
                    .pass = entry.record.canonical_name,
                    .position = entry.record.sequence_index,
                    .reason = std::string{to_string(entry.reason)},
                    .target = entry.target});
        }
        details.ambiguous_targets = alignment.ambiguous_targets;
        details.mapping_success_rate = mapping_success_rate(matched, unmatched_a);

        return report;
    }

    std::string render_report_json(const analysis_report& report) {
        return detail::serialize_report_json(report);
    }

    std::string render_mapping_json(const alignment_result& alignment) {
        internal::mapping_used_payload payload{};
        payload.successful_mappings.reserve(alignment.pairs.size());
        for (const auto& pair : alignment.pairs) {
            payload.successful_mappings.push_back(internal::mapping_used_entry{
                    .a_pass = pair.a.canonical_name,
                    .b_pass = pair.b.canonical_name,
                    .a_position = pair.a.sequence_index,
                    .b_position = pair.b.sequence_index});
        }
        for (const auto& entry : alignment.unmatched) {
            payload.skipped_legacy_passes.push_back(entry.record.canonical_name);
        }
        payload.ambiguous_targets = alignment.ambiguous_targets;
        payload.statistics = internal::mapping_used_statistics{
                .total_mappings = alignment.pairs.size(),
                .skipped_passes = alignment.unmatched.size(),
                .success_rate = mapping_success_rate(alignment.pairs.size(), alignment.unmatched.size())};

        return detail::serialize_report_json(payload);
    }

    std::string render_divergence_diff(const divergence_result& divergence, std::string_view generated_at) {
        if (!divergence.found || !divergence.pair) {
            return {};
        }
        const auto& a_name = divergence.pair->a.canonical_name;
        const auto& b_name = divergence.pair->b.canonical_name;

        std::ostringstream os{};
        os << "LLVM IR Divergence Diff\n";
        os << "======================\n\n";
        os << "Legacy Pass: " << a_name << '\n';
        os << "NPM Pass:    " << b_name << '\n';
        os << "Generated:   " << generated_at << "\n\n";
        os << "Unified Diff:\n";
        os << "-------------\n";
        os << diff::unified_diff(divergence.a_text, divergence.b_text, "legacy/{}"_format(a_name), "npm/{}"_format(b_name));
        return os.str();
    }

    std::string render_visualization(const std::vector<pass_record>& a_passes,
                                     const std::vector<pass_record>& b_passes,
                                     const alignment_result& alignment,
                                     const divergence_result& divergence) {
        std::vector<detail::visualization_row> rows{};
        rows.reserve(a_passes.size() + b_passes.size());

        std::set<size_t> mapped_a{};
        std::set<size_t> mapped_b{};

        size_t next_a = 0U;
        size_t next_b = 0U;
        for (size_t i = 0U; i < alignment.pairs.size(); ++i) {
            const auto& pair = alignment.pairs[i];
            auto a_idx = pair.a.sequence_index;
            auto b_idx = pair.b.sequence_index;

            for (; next_a < a_idx && next_a < a_passes.size(); ++next_a) {
                rows.push_back({.left = detail::pass_cell(a_passes[next_a])});
            }
            for (; next_b < b_idx && next_b < b_passes.size(); ++next_b) {
                rows.push_back({.right = detail::pass_cell(b_passes[next_b])});
            }

            auto is_divergent = divergence.found && divergence.index == i;
            rows.push_back(
                    {.left = detail::pass_cell(pair.a),
                     .arrow = is_divergent ? detail::arrow_divergent : detail::arrow_mapped,
                     .right = detail::pass_cell(pair.b)});

            mapped_a.insert(a_idx);
            mapped_b.insert(b_idx);
            next_a = std::max(next_a, a_idx + 1U);
            next_b = std::max(next_b, b_idx + 1U);
        }
        for (; next_a < a_passes.size(); ++next_a) {
            rows.push_back({.left = detail::pass_cell(a_passes[next_a])});
        }
        for (; next_b < b_passes.size(); ++next_b) {
            rows.push_back({.right = detail::pass_cell(b_passes[next_b])});
        }

        std::string rule(detail::visualization_width, '=');
        std::string half_rule(detail::visualization_header_width, '=');

        std::ostringstream os{};
        os << "LLVM PASS PIPELINE MAPPING VISUALIZATION\n";
        os << rule << "\n\n";
        os << "{:<{}}"_format("LEGACY PASSES ({} total)"_format(a_passes.size()), detail::visualization_header_width);
        os << "NPM PASSES ({} total)\n"_format(b_passes.size());
        os << half_rule << half_rule << "\n\n";

        for (const auto& row : rows) {
            os << detail::render_row(row) << '\n';
        }

        os << '\n' << rule << '\n';
        os << "SUMMARY:\n";
        os << "  Total Legacy Passes: " << a_passes.size() << '\n';
        os << "  Total NPM Passes: " << b_passes.size() << '\n';
        os << "  Successfully Mapped: " << alignment.pairs.size() << '\n';
        os << "  Unmapped Legacy: " << a_passes.size() - mapped_a.size() << '\n';
        os << "  Unmapped NPM: " << b_passes.size() - mapped_b.size() << '\n';

        if (divergence.found && divergence.pair) {
            const auto& pair = *divergence.pair;
            os << "\nFIRST DIVERGENCE:\n";
            os << "  Legacy: {} (#{})\n"_format(pair.a.canonical_name, pair.a.sequence_index);
            os << "  NPM: {} (#{})\n"_format(pair.b.canonical_name, pair.b.sequence_index);
            os << "  Marked with: <-D->\n";
        }
        else {
            os << "\nNO DIVERGENCE FOUND\n";
        }

        os << "\nLEGEND:\n";
        os << "  <--->  Mapped passes with identical IR\n";
        os << "  <-D->  First divergent pass pair\n";
        os << "  (no arrow)  Unmapped pass\n";
        return os.str();
    }

    void print_summary(const analysis_report& report, std::ostream& os) {
        std::string rule(60U, '=');
        const auto& summary = report.summary;
        const auto& div = report.divergence_analysis;

        os << '\n' << rule << '\n';
        os << "LLVM IR DIVERGENCE ANALYSIS RESULTS\n";
        os << rule << '\n';
        os << "SUMMARY:\n";
        os << "   Legacy passes:       " << summary.total_a_passes << '\n';
        os << "   NPM passes:          " << summary.total_b_passes << '\n';
        os << "   Successfully mapped: " << summary.successfully_mapped << '\n';
        os << "   Skipped passes:      " << summary.unmatched_a_passes << '\n';

        auto print_pair = [&os](const report_pass_pair& pair) {
            os << "   Position:      Pass pair #" << pair.index << '\n';
            os << "   Legacy Pass:   \"{}\" (#{} in legacy pipeline)\n"_format(pair.a_pass, pair.a_position);
            os << "   NPM Pass:      \"{}\" (#{} in NPM pipeline)\n"_format(pair.b_pass, pair.b_position);
        };

        if (div.divergence_found && div.first_divergent_pass) {
            os << "\nFIRST DIVERGENCE FOUND:\n";
            print_pair(*div.first_divergent_pass);
            if (div.last_common_pass) {
                os << "\nLAST COMMON PASS:\n";
                print_pair(*div.last_common_pass);
            }
        }
        else {
            os << "\nNO DIVERGENCE FOUND!\n";
            os << "   All " << div.total_compared_passes << " compared passes have identical IR\n";
        }

        const auto& files = report.output_files;
        os << "\nOUTPUT FILES:\n";
        os << "   JSON Report:   " << files.json_report << '\n';
        if (files.diff_file) {
            os << "   Diff File:     " << *files.diff_file << '\n';
        }
        os << "   Mapping Info:  " << files.mapping_file << '\n';
        os << "   Visualization: " << files.visualization_file << '\n';
        os << rule << "\n\n";
    }

    void write_reports(analysis_report& report,
                       const report_paths& paths,
                       const std::vector<pass_record>& a_passes,
                       const std::vector<pass_record>& b_passes,
                       const alignment_result& alignment,
                       const divergence_result& divergence) {
        std::error_code ec{};
        fs::create_directories(paths.analysis_dir, ec);
        if (ec) {
            throw storage_fault("failed to create directory {}: {}"_format(paths.analysis_dir.string(), ec.message()));
        }
        fs::create_directories(paths.logs_dir, ec);
        if (ec) {
            throw storage_fault("failed to create directory {}: {}"_format(paths.logs_dir.string(), ec.message()));
        }

        auto report_path = paths.analysis_dir / "divergence_report.json";
        auto mapping_path = paths.analysis_dir / "pass_mapping_used.json";
        auto diff_path = paths.analysis_dir / "first_divergence_diff.txt";
        auto visualization_path = paths.logs_dir / "pass_mapping_visualization.txt";

        report.output_files.json_report = report_path.string();
        report.output_files.mapping_file = mapping_path.string();
        report.output_files.visualization_file = visualization_path.string();
        report.output_files.diff_file.reset();

        if (divergence.found) {
            detail::write_text_file(diff_path, render_divergence_diff(divergence, report.analysis_info.timestamp));
            report.output_files.diff_file = diff_path.string();
        }
        detail::write_text_file(mapping_path, render_mapping_json(alignment));
        detail::write_text_file(visualization_path, render_visualization(a_passes, b_passes, alignment, divergence));
        detail::write_text_file(report_path, render_report_json(report));
    }

}  // namespace irdiverge
