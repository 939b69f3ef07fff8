#pragma once

#include "irdiverge/report.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace irdiverge::internal {

    struct persisted_normalization {
        bool drop_blank_lines{true};
        bool drop_metadata{true};
        bool strip_comments{false};
        bool strip_debug_info{true};
        bool rename_temporaries{true};
        bool rename_labels{true};
        bool collapse_whitespace{true};
    };

    struct persisted_config {
        int schema_version{1};
        persisted_normalization normalization{};
        std::vector<std::string> exclude_a{};
        std::vector<std::string> exclude_b{};
    };

    struct mapping_used_entry {
        std::string a_pass{};
        std::string b_pass{};
        size_t a_position{};
        size_t b_position{};
    };

    struct mapping_used_statistics {
        size_t total_mappings{};
        size_t skipped_passes{};
        double success_rate{};
    };

    struct mapping_used_payload {
        std::vector<mapping_used_entry> successful_mappings{};
        std::vector<std::string> skipped_legacy_passes{};
        std::vector<std::string> ambiguous_targets{};
        mapping_used_statistics statistics{};
    };

}  // namespace irdiverge::internal

namespace glz {

    template <>
    struct meta<irdiverge::internal::persisted_normalization> {
        using T = irdiverge::internal::persisted_normalization;
        static constexpr auto value =
                object("drop_blank_lines",
                       &T::drop_blank_lines,
                       "drop_metadata",
                       &T::drop_metadata,
                       "strip_comments",
                       &T::strip_comments,
                       "strip_debug_info",
                       &T::strip_debug_info,
                       "rename_temporaries",
                       &T::rename_temporaries,
                       "rename_labels",
                       &T::rename_labels,
                       "collapse_whitespace",
                       &T::collapse_whitespace);
    };

    template <>
    struct meta<irdiverge::internal::persisted_config> {
        using T = irdiverge::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "normalization",
                       &T::normalization,
                       "exclude_a",
                       &T::exclude_a,
                       "exclude_b",
                       &T::exclude_b);
    };

    template <>
    struct meta<irdiverge::internal::mapping_used_entry> {
        using T = irdiverge::internal::mapping_used_entry;
        static constexpr auto value =
                object("legacy_pass",
                       &T::a_pass,
                       "npm_pass",
                       &T::b_pass,
                       "legacy_position",
                       &T::a_position,
                       "npm_position",
                       &T::b_position);
    };

    template <>
    struct meta<irdiverge::internal::mapping_used_statistics> {
        using T = irdiverge::internal::mapping_used_statistics;
        static constexpr auto value = object(
                "total_mappings", &T::total_mappings, "skipped_passes", &T::skipped_passes, "success_rate", &T::success_rate);
    };

    template <>
    struct meta<irdiverge::internal::mapping_used_payload> {
        using T = irdiverge::internal::mapping_used_payload;
        static constexpr auto value =
                object("successful_mappings",
                       &T::successful_mappings,
                       "skipped_legacy_passes",
                       &T::skipped_legacy_passes,
                       "ambiguous_targets",
                       &T::ambiguous_targets,
                       "statistics",
                       &T::statistics);
    };

    template <>
    struct meta<irdiverge::report_analysis_info> {
        using T = irdiverge::report_analysis_info;
        static constexpr auto value = object(
                "timestamp", &T::timestamp, "tool_version", &T::tool_version, "analysis_type", &T::analysis_type);
    };

    template <>
    struct meta<irdiverge::report_summary> {
        using T = irdiverge::report_summary;
        static constexpr auto value =
                object("total_legacy_passes",
                       &T::total_a_passes,
                       "total_npm_passes",
                       &T::total_b_passes,
                       "successfully_mapped",
                       &T::successfully_mapped,
                       "skipped_legacy_passes",
                       &T::unmatched_a_passes,
                       "unused_npm_passes",
                       &T::unused_b_passes);
    };

    template <>
    struct meta<irdiverge::report_pass_pair> {
        using T = irdiverge::report_pass_pair;
        static constexpr auto value =
                object("index",
                       &T::index,
                       "legacy_pass",
                       &T::a_pass,
                       "npm_pass",
                       &T::b_pass,
                       "legacy_file",
                       &T::a_file,
                       "npm_file",
                       &T::b_file,
                       "legacy_position",
                       &T::a_position,
                       "npm_position",
                       &T::b_position);
    };

    template <>
    struct meta<irdiverge::report_divergence> {
        using T = irdiverge::report_divergence;
        static constexpr auto value =
                object("divergence_found",
                       &T::divergence_found,
                       "message",
                       &T::message,
                       "first_divergent_pass",
                       &T::first_divergent_pass,
                       "last_common_pass",
                       &T::last_common_pass,
                       "passes_compared_before_divergence",
                       &T::passes_compared_before_divergence,
                       "total_compared_passes",
                       &T::total_compared_passes);
    };

    template <>
    struct meta<irdiverge::report_mapping_entry> {
        using T = irdiverge::report_mapping_entry;
        static constexpr auto value =
                object("pair_index",
                       &T::pair_index,
                       "legacy_pass",
                       &T::a_pass,
                       "npm_pass",
                       &T::b_pass,
                       "legacy_file",
                       &T::a_file,
                       "npm_file",
                       &T::b_file);
    };

    template <>
    struct meta<irdiverge::report_unmatched_entry> {
        using T = irdiverge::report_unmatched_entry;
        static constexpr auto value =
                object("pass", &T::pass, "position", &T::position, "reason", &T::reason, "target", &T::target);
    };

    template <>
    struct meta<irdiverge::report_mapping_details> {
        using T = irdiverge::report_mapping_details;
        static constexpr auto value =
                object("successful_mappings",
                       &T::successful_mappings,
                       "unmatched_passes",
                       &T::unmatched_passes,
                       "ambiguous_targets",
                       &T::ambiguous_targets,
                       "mapping_success_rate",
                       &T::mapping_success_rate);
    };

    template <>
    struct meta<irdiverge::report_output_files> {
        using T = irdiverge::report_output_files;
        static constexpr auto value =
                object("json_report",
                       &T::json_report,
                       "diff_file",
                       &T::diff_file,
                       "mapping_file",
                       &T::mapping_file,
                       "visualization_file",
                       &T::visualization_file);
    };

    template <>
    struct meta<irdiverge::analysis_report> {
        using T = irdiverge::analysis_report;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "analysis_info",
                       &T::analysis_info,
                       "summary",
                       &T::summary,
                       "divergence_analysis",
                       &T::divergence_analysis,
                       "mapping_details",
                       &T::mapping_details,
                       "output_files",
                       &T::output_files,
                       "success",
                       &T::success);
    };

}  // namespace glz
