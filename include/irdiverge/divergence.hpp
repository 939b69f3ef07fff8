#pragma once

#include "align.hpp"
#include "config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace irdiverge {

    struct divergence_result {
        bool found{false};
        size_t index{};
        std::optional<alignment_pair> pair{};
        std::optional<alignment_pair> last_common_pair{};
        // pairs normalized and compared, including the divergent one
        size_t compared{};
        // canonical texts of the divergent pair
        std::string a_text{};
        std::string b_text{};
    };

    // Stops at the first pair whose normalized contents differ; later pairs are never read.
    divergence_result find_first_divergence(
            const std::vector<alignment_pair>& pairs,
            const normalize_options& options,
            const artifact_store& a_store,
            const artifact_store& b_store);

    // Both pipelines extracted into the same store
    divergence_result find_first_divergence(
            const std::vector<alignment_pair>& pairs, const normalize_options& options, const artifact_store& store);

}  // namespace irdiverge
