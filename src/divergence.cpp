#include "irdiverge/divergence.hpp"

#include "irdiverge/normalize.hpp"

using namespace irdiverge::literals;

namespace irdiverge {

    divergence_result find_first_divergence(
            const std::vector<alignment_pair>& pairs,
            const normalize_options& options,
            const artifact_store& a_store,
            const artifact_store& b_store) {
        divergence_result result{};

        for (size_t i = 0U; i < pairs.size(); ++i) {
            const auto& pair = pairs[i];
            debug_log("comparing pair {}: {} vs {}"_format(i, pair.a.canonical_name, pair.b.canonical_name));

            auto a_text = normalize(a_store.read(pair.a.content), options);
            auto b_text = normalize(b_store.read(pair.b.content), options);
            ++result.compared;

            if (a_text != b_text) {
                result.found = true;
                result.index = i;
                result.pair = pair;
                if (i > 0U) {
                    result.last_common_pair = pairs[i - 1U];
                }
                result.a_text = std::move(a_text);
                result.b_text = std::move(b_text);
                return result;
            }
        }

        return result;
    }

    divergence_result find_first_divergence(
            const std::vector<alignment_pair>& pairs, const normalize_options& options, const artifact_store& store) {
        return find_first_divergence(pairs, options, store, store);
    }

}  // namespace irdiverge
