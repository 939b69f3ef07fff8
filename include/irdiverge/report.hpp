#pragma once

#include "align.hpp"
#include "divergence.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace irdiverge {

    inline constexpr auto report_tool_version = "1.0"sv;
    inline constexpr auto report_analysis_type = "llvm_ir_divergence"sv;

    struct report_analysis_info {
        std::string timestamp{};
        std::string tool_version{report_tool_version};
        std::string analysis_type{report_analysis_type};
    };

    struct report_summary {
        size_t total_a_passes{};
        size_t total_b_passes{};
        size_t successfully_mapped{};
        size_t unmatched_a_passes{};
        size_t unused_b_passes{};
    };

    struct report_pass_pair {
        size_t index{};
        std::string a_pass{};
        std::string b_pass{};
        std::string a_file{};
        std::string b_file{};
        size_t a_position{};
        size_t b_position{};
    };

    struct report_divergence {
        bool divergence_found{false};
        std::optional<std::string> message{};
        std::optional<report_pass_pair> first_divergent_pass{};
        std::optional<report_pass_pair> last_common_pass{};
        std::optional<size_t> passes_compared_before_divergence{};
        size_t total_compared_passes{};
    };

    struct report_mapping_entry {
        size_t pair_index{};
        std::string a_pass{};
        std::string b_pass{};
        std::string a_file{};
        std::string b_file{};
    };

    struct report_unmatched_entry {
        std::string pass{};
        size_t position{};
        std::string reason{};
        std::optional<std::string> target{};
    };

    struct report_mapping_details {
        std::vector<report_mapping_entry> successful_mappings{};
        std::vector<report_unmatched_entry> unmatched_passes{};
        std::vector<std::string> ambiguous_targets{};
        double mapping_success_rate{};
    };

    struct report_output_files {
        std::string json_report{};
        std::optional<std::string> diff_file{};
        std::string mapping_file{};
        std::string visualization_file{};
    };

    struct analysis_report {
        int schema_version{1};
        report_analysis_info analysis_info{};
        report_summary summary{};
        report_divergence divergence_analysis{};
        report_mapping_details mapping_details{};
        report_output_files output_files{};
        bool success{true};
    };

    // matched / (matched + unmatched), 0 when there is nothing to rate
    double mapping_success_rate(size_t matched, size_t unmatched);

    analysis_report build_report(const std::vector<pass_record>& a_passes,
                                 const std::vector<pass_record>& b_passes,
                                 const alignment_result& alignment,
                                 const divergence_result& divergence);

    std::string render_report_json(const analysis_report& report);

    std::string render_mapping_json(const alignment_result& alignment);

    // Header, pass names and the unified diff of the divergent pair's canonical texts
    std::string render_divergence_diff(const divergence_result& divergence, std::string_view generated_at);

    // Dual-column listing of both pipelines; matched pairs share a row, the divergent pair is marked
    std::string render_visualization(const std::vector<pass_record>& a_passes,
                                     const std::vector<pass_record>& b_passes,
                                     const alignment_result& alignment,
                                     const divergence_result& divergence);

    void print_summary(const analysis_report& report, std::ostream& os);

    struct report_paths {
        std::filesystem::path analysis_dir{};
        std::filesystem::path logs_dir{};
    };

    // Writes every report artifact and fills `report.output_files`; throws storage_fault on write failure.
    void write_reports(analysis_report& report,
                       const report_paths& paths,
                       const std::vector<pass_record>& a_passes,
                       const std::vector<pass_record>& b_passes,
                       const alignment_result& alignment,
                       const divergence_result& divergence);

}  // namespace irdiverge
