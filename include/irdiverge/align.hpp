#pragma once

#include "config.hpp"
#include "extract.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace irdiverge {

    // Pipeline A canonical name -> pipeline B canonical name
    using name_mapping = std::map<std::string, std::string>;

    enum class unmatched_reason : uint8_t {
        excluded_a,
        unmapped,
        excluded_b,
        no_chronological_match,
    };

    inline constexpr std::string_view to_string(unmatched_reason reason) {
        switch (reason) {
            case unmatched_reason::excluded_a:
                return "excluded_a"sv;
            case unmatched_reason::unmapped:
                return "unmapped"sv;
            case unmatched_reason::excluded_b:
                return "excluded_b"sv;
            case unmatched_reason::no_chronological_match:
                return "no_chronological_match"sv;
        }
        return "unmapped"sv;
    }

    struct alignment_pair {
        pass_record a{};
        pass_record b{};
    };

    struct unmatched_pass {
        pass_record record{};
        unmatched_reason reason{unmatched_reason::unmapped};
        std::optional<std::string> target{};
    };

    struct alignment_result {
        std::vector<alignment_pair> pairs{};
        std::vector<unmatched_pass> unmatched{};
        std::vector<std::string> ambiguous_targets{};
    };

    // Greedy, order-preserving: each A record takes the earliest unused B record with the mapped name
    // that comes after the previous match.
    alignment_result align(const std::vector<pass_record>& a,
                           const std::vector<pass_record>& b,
                           const name_mapping& mapping,
                           const exclusion_set& exclusions);

}  // namespace irdiverge
