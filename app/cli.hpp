#pragma once

#include "irdiverge/analyzer.hpp"

#include <optional>
#include <string>

namespace irdiverge::cli {

    // Flags that steer the run itself rather than the analysis
    struct run_options {
        bool clean{false};
        bool no_cleanup{false};
        std::optional<std::string> archive{};
    };

    std::optional<int> parse_cli(int argc, char** argv, analysis_config& cfg, run_options& opts);
    int run(analysis_config& cfg, const run_options& opts);

}  // namespace irdiverge::cli
