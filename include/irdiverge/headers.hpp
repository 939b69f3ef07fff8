#pragma once

#include "config.hpp"
#include "format.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace irdiverge {

    enum class pass_scope : uint8_t { module, function, unknown };

    inline constexpr std::string_view to_string(pass_scope scope) {
        switch (scope) {
            case pass_scope::module:
                return "module"sv;
            case pass_scope::function:
                return "function"sv;
            case pass_scope::unknown:
                return "unknown"sv;
        }
        return "unknown"sv;
    }

    struct header_descriptor {
        std::string canonical_name{};
        pass_scope scope{pass_scope::unknown};
        std::optional<std::string> target{};
        size_t line_number{};
        std::string line_text{};
    };

    namespace banner {
        inline constexpr auto legacy_prefix = "*** IR Dump After "sv;
        inline constexpr auto npm_prefix = "; *** IR Dump After "sv;
        inline constexpr auto terminator = " ***"sv;
        inline constexpr auto target_separator = " on "sv;
        inline constexpr auto module_marker = "[module]"sv;
    }  // namespace banner

    // Returns the descriptor for `line` when it is a banner of `dialect`; `line_number` is copied through.
    std::optional<header_descriptor> match_header(std::string_view line, dump_dialect dialect, size_t line_number);

    // "Instrument function entry/exit (post inlining) (post-inline-ee-instrument)" -> "post-inline-ee-instrument"
    std::string last_parenthesized_group(std::string_view text);

    std::vector<header_descriptor> scan_headers(std::string_view text, dump_dialect dialect);

    // Throws missing_input when the stream fails for a reason other than end of input.
    std::vector<header_descriptor> scan_headers(std::istream& in, dump_dialect dialect);

}  // namespace irdiverge
