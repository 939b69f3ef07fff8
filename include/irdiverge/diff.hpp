#pragma once

#include "format.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace irdiverge::diff {

    using namespace std::string_view_literals;

    enum class edit_kind : uint8_t { equal, remove, insert };

    inline constexpr std::string_view to_string(edit_kind kind) {
        switch (kind) {
            case edit_kind::equal:
                return "equal"sv;
            case edit_kind::remove:
                return "remove"sv;
            case edit_kind::insert:
                return "insert"sv;
        }
        return "equal"sv;
    }

    // a_pos/b_pos are the 0-based cursors into each side before the edit is applied
    struct edit_op {
        edit_kind kind{edit_kind::equal};
        size_t a_pos{};
        size_t b_pos{};
    };

    // Shortest edit script (Myers, O(ND)) turning `a` into `b`.
    std::vector<edit_op> diff_lines(const std::vector<std::string_view>& a, const std::vector<std::string_view>& b);

    // Empty when the texts are identical.
    std::string unified_diff(std::string_view a_text,
                             std::string_view b_text,
                             std::string_view from_label,
                             std::string_view to_label,
                             size_t context = 3U);

}  // namespace irdiverge::diff
