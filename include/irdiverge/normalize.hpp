#pragma once

#include "config.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace irdiverge {

    namespace normalize_tokens {
        inline constexpr auto temp_prefix = "temp_"sv;
        inline constexpr auto label_prefix = "label_"sv;
        inline constexpr auto debug_attachment = ", !dbg !"sv;
        inline constexpr char metadata_sigil = '!';
        inline constexpr char comment_sigil = ';';
        inline constexpr char local_sigil = '%';
    }  // namespace normalize_tokens

    struct transparent_string_hash {
        using is_transparent = void;

        constexpr size_t operator()(std::string_view value) const noexcept {
            return std::hash<std::string_view>{}(value);
        }
    };

    struct transparent_string_equal {
        using is_transparent = void;

        constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept { return lhs == rhs; }
    };

    // Assigns `<prefix>N` names in first-seen order; one instance per category per normalized block.
    class name_interner {
      public:
        explicit name_interner(std::string_view prefix) : prefix_{prefix} {}

        std::string_view intern(std::string_view token) {
            if (auto it = by_token.find(token); it != by_token.end()) {
                return it->second;
            }
            auto canonical = std::string{prefix_} + std::to_string(next_id++);
            return by_token.emplace(std::string{token}, std::move(canonical)).first->second;
        }

        [[nodiscard]] std::optional<std::string_view> find(std::string_view token) const {
            if (auto it = by_token.find(token); it != by_token.end()) {
                return std::string_view{it->second};
            }
            return std::nullopt;
        }

        [[nodiscard]] constexpr size_t size(this const auto& self) noexcept { return self.next_id; }

      private:
        std::string_view prefix_{};
        size_t next_id{};
        std::unordered_map<std::string, std::string, transparent_string_hash, transparent_string_equal> by_token{};
    };

    // Label name defined by `line` ("for.body:", "3:  ; preds = %2", "\"a b\":"), if any. Quoted names keep their quotes.
    std::optional<std::string_view> find_label_definition(std::string_view line);

    // Removes the first ';' outside a double-quoted string and everything after it.
    std::string_view strip_comment(std::string_view line);

    std::string strip_debug_attachments(std::string_view line);

    std::string collapse_whitespace(std::string_view line);

    std::string normalize(std::string_view text, const normalize_options& options);

}  // namespace irdiverge
