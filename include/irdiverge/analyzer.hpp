#pragma once

#include "config.hpp"
#include "log.hpp"
#include "report.hpp"

#include <chrono>
#include <filesystem>
#include <string_view>

namespace irdiverge {

    // Directory layout of one run under `analysis_config::output_dir`
    struct output_layout {
        std::filesystem::path root{};
        std::filesystem::path extracted_a{};
        std::filesystem::path extracted_b{};
        std::filesystem::path analysis{};
        std::filesystem::path logs{};
    };

    output_layout make_output_layout(const std::filesystem::path& root);

    // Creates every directory of `layout`; throws storage_fault.
    void prepare_output_layout(const output_layout& layout);

    // output/archive/<name>_<YYYYmmdd_HHMMSS>
    std::filesystem::path archive_output_dir(
            std::string_view name, std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    // True when a previous run left extracted artifacts under `layout.root`
    bool has_previous_results(const output_layout& layout);

    // Removes extracted/, analysis/ and logs/ of a previous run; throws storage_fault.
    void remove_previous_results(const output_layout& layout);

    /*
     * Full pipeline: input checks, mapping load, concurrent scan+extract of both dumps,
     * alignment, first-divergence scan and report files.
     *
     * Throws missing_input before any processing when a dump or the mapping is absent,
     * malformed_mapping before any scanning, storage_fault on artifact or report writes.
     */
    analysis_report run_analysis(const analysis_config& cfg, run_log& log);

}  // namespace irdiverge
