#include "irdiverge/align.hpp"

#include "irdiverge/mapping.hpp"

#include <unordered_set>

using namespace irdiverge::literals;

namespace irdiverge {
    namespace detail {

        struct alignment_cursor {
            std::optional<size_t> last_b{};
            std::unordered_set<size_t> consumed{};
        };

        static std::optional<size_t> find_earliest_available(
                const std::vector<pass_record>& b, std::string_view target, const alignment_cursor& cursor) {
            for (size_t i = 0U; i < b.size(); ++i) {
                const auto& candidate = b[i];
                if (cursor.last_b && candidate.sequence_index <= *cursor.last_b) {
                    continue;
                }
                if (candidate.canonical_name == target && !cursor.consumed.contains(candidate.sequence_index)) {
                    return i;
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    alignment_result align(const std::vector<pass_record>& a,
                           const std::vector<pass_record>& b,
                           const name_mapping& mapping,
                           const exclusion_set& exclusions) {
        alignment_result result{};
        result.ambiguous_targets = find_ambiguous_targets(mapping);

        detail::alignment_cursor cursor{};

        for (const auto& record : a) {
            if (exclusions.exclude_a.contains(record.canonical_name)) {
                result.unmatched.push_back(unmatched_pass{.record = record, .reason = unmatched_reason::excluded_a});
                continue;
            }

            auto it = mapping.find(record.canonical_name);
            if (it == mapping.end() || it->second.empty()) {
                result.unmatched.push_back(unmatched_pass{.record = record, .reason = unmatched_reason::unmapped});
                continue;
            }

            const auto& target = it->second;
            if (exclusions.exclude_b.contains(target)) {
                result.unmatched.push_back(
                        unmatched_pass{.record = record, .reason = unmatched_reason::excluded_b, .target = target});
                continue;
            }

            auto match = detail::find_earliest_available(b, target, cursor);
            if (!match) {
                result.unmatched.push_back(
                        unmatched_pass{
                                .record = record, .reason = unmatched_reason::no_chronological_match, .target = target});
                continue;
            }

            const auto& counterpart = b[*match];
            cursor.consumed.insert(counterpart.sequence_index);
            cursor.last_b = counterpart.sequence_index;
            debug_log("aligned {}#{} -> {}#{}"_format(
                    record.canonical_name, record.sequence_index, counterpart.canonical_name, counterpart.sequence_index));
            result.pairs.push_back(alignment_pair{.a = record, .b = counterpart});
        }

        return result;
    }

}  // namespace irdiverge
