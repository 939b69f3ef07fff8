#include "irdiverge/normalize.hpp"

#include "irdiverge/format.hpp"

#include <algorithm>

using namespace irdiverge::literals;

namespace irdiverge {
    namespace detail {

        constexpr bool ascii_is_alpha(char c) noexcept {
            auto lower = static_cast<char>(c | 0x20);
            return lower >= 'a' && lower <= 'z';
        }

        constexpr bool ascii_is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        // LLVM identifier body: [-a-zA-Z$._0-9]
        constexpr bool is_ident_char(char c) noexcept {
            return ascii_is_alpha(c) || ascii_is_digit(c) || c == '_' || c == '.' || c == '$' || c == '-';
        }

        constexpr bool is_label_start(char c) noexcept { return ascii_is_alpha(c) || c == '_' || c == '.' || c == '$'; }

        // Bare tokens directly after these belong to another namespace (@global, !meta, #attr)
        constexpr bool is_foreign_sigil(char c) noexcept { return c == '@' || c == '!' || c == '#'; }

        struct rename_state {
            name_interner temporaries{normalize_tokens::temp_prefix};
            name_interner labels{normalize_tokens::label_prefix};
        };

        static size_t quoted_end(std::string_view line, size_t open) {
            auto close = line.find('"', open + 1U);
            return close == std::string_view::npos ? line.size() : close + 1U;
        }

        // `line[begin, end)` is the leading token of a label definition ("3:", "\"a b\":")
        static bool is_definition_site(std::string_view line, size_t begin, size_t end) {
            return utils::trim_left(line.substr(0U, begin)).empty() && end < line.size() && line[end] == ':';
        }

        static bool all_digits(std::string_view token) {
            return !token.empty() && std::ranges::all_of(token, ascii_is_digit);
        }

        static void collect_labels(const std::vector<std::string_view>& lines, rename_state& state) {
            for (auto line : lines) {
                if (auto label = find_label_definition(line)) {
                    state.labels.intern(*label);
                }
            }
        }

        static std::string rename_tokens(std::string_view line, const normalize_options& options, rename_state& state) {
            std::string out{};
            out.reserve(line.size());

            size_t i = 0U;
            while (i < line.size()) {
                auto c = line[i];

                if (c == '"') {
                    auto end = quoted_end(line, i);
                    auto quoted = line.substr(i, end - i);
                    auto label = (options.rename_labels && is_definition_site(line, i, end)) ? state.labels.find(quoted)
                                                                                             : std::nullopt;
                    out.append(label ? *label : quoted);
                    i = end;
                    continue;
                }

                if (c == normalize_tokens::local_sigil && i + 1U < line.size()) {
                    if (line[i + 1U] == '"') {
                        auto end = quoted_end(line, i + 1U);
                        auto name = line.substr(i + 1U, end - i - 1U);
                        out += normalize_tokens::local_sigil;
                        if (auto label = options.rename_labels ? state.labels.find(name) : std::nullopt) {
                            out += *label;
                        }
                        else if (options.rename_temporaries) {
                            out += state.temporaries.intern(name);
                        }
                        else {
                            out += name;
                        }
                        i = end;
                        continue;
                    }

                    if (is_ident_char(line[i + 1U])) {
                        auto end = i + 1U;
                        while (end < line.size() && is_ident_char(line[end])) {
                            ++end;
                        }
                        auto name = line.substr(i + 1U, end - i - 1U);
                        out += normalize_tokens::local_sigil;
                        if (auto label = options.rename_labels ? state.labels.find(name) : std::nullopt) {
                            out += *label;
                        }
                        else if (options.rename_temporaries) {
                            out += state.temporaries.intern(name);
                        }
                        else {
                            out += name;
                        }
                        i = end;
                        continue;
                    }
                }

                if (is_ident_char(c)) {
                    auto end = i;
                    while (end < line.size() && is_ident_char(line[end])) {
                        ++end;
                    }
                    auto token = line.substr(i, end - i);
                    auto foreign = i > 0U && is_foreign_sigil(line[i - 1U]);
                    // bare numbers are constants everywhere except a numbered block's definition
                    auto candidate = !foreign && (!all_digits(token) || is_definition_site(line, i, end));
                    if (auto label = (options.rename_labels && candidate) ? state.labels.find(token) : std::nullopt) {
                        out += *label;
                    }
                    else {
                        out += token;
                    }
                    i = end;
                    continue;
                }

                out += c;
                ++i;
            }
            return out;
        }

    }  // namespace detail

    std::optional<std::string_view> find_label_definition(std::string_view line) {
        auto rest = utils::trim_left(line);
        if (rest.empty()) {
            return std::nullopt;
        }

        size_t end = 0U;
        if (rest.front() == '"') {
            end = detail::quoted_end(rest, 0U);
        }
        else if (detail::ascii_is_digit(rest.front())) {
            while (end < rest.size() && detail::ascii_is_digit(rest[end])) {
                ++end;
            }
        }
        else if (detail::is_label_start(rest.front())) {
            end = 1U;
            while (end < rest.size() && detail::is_ident_char(rest[end])) {
                ++end;
            }
        }
        else {
            return std::nullopt;
        }

        if (end >= rest.size() || rest[end] != ':') {
            return std::nullopt;
        }

        auto tail = utils::trim_left(rest.substr(end + 1U));
        if (!tail.empty() && tail.front() != normalize_tokens::comment_sigil) {
            return std::nullopt;
        }
        return rest.substr(0U, end);
    }

    std::string_view strip_comment(std::string_view line) {
        bool in_quote = false;
        for (size_t i = 0U; i < line.size(); ++i) {
            if (line[i] == '"') {
                in_quote = !in_quote;
            }
            else if (line[i] == normalize_tokens::comment_sigil && !in_quote) {
                return line.substr(0U, i);
            }
        }
        return line;
    }

    std::string strip_debug_attachments(std::string_view line) {
        std::string out{};
        out.reserve(line.size());

        size_t cursor = 0U;
        while (cursor < line.size()) {
            auto pos = line.find(normalize_tokens::debug_attachment, cursor);
            if (pos == std::string_view::npos) {
                break;
            }

            auto digits_begin = pos + normalize_tokens::debug_attachment.size();
            auto digits_end = digits_begin;
            while (digits_end < line.size() && detail::ascii_is_digit(line[digits_end])) {
                ++digits_end;
            }

            if (digits_end == digits_begin) {
                out.append(line.substr(cursor, digits_begin - cursor));
            }
            else {
                out.append(line.substr(cursor, pos - cursor));
            }
            cursor = digits_end;
        }

        if (cursor < line.size()) {
            out.append(line.substr(cursor));
        }
        return out;
    }

    std::string collapse_whitespace(std::string_view line) {
        line = utils::trim(line);

        std::string out{};
        out.reserve(line.size());
        bool in_space = false;
        for (auto c : line) {
            if (utils::is_space(c)) {
                in_space = true;
                continue;
            }
            if (in_space) {
                out += ' ';
                in_space = false;
            }
            out += c;
        }
        return out;
    }

    std::string normalize(std::string_view text, const normalize_options& options) {
        auto lines = utils::split_lines(text);

        detail::rename_state state{};
        if (options.rename_labels) {
            detail::collect_labels(lines, state);
        }

        std::vector<std::string> normalized{};
        normalized.reserve(lines.size());

        for (auto line : lines) {
            auto trimmed = utils::trim(line);

            if (trimmed.empty()) {
                if (!options.drop_blank_lines) {
                    normalized.emplace_back(options.collapse_whitespace ? std::string_view{} : line);
                }
                continue;
            }

            if (options.drop_metadata && trimmed.front() == normalize_tokens::metadata_sigil) {
                continue;
            }

            std::string current{options.strip_comments ? strip_comment(line) : line};

            if (options.strip_debug_info) {
                current = strip_debug_attachments(current);
            }
            if (options.rename_labels || options.rename_temporaries) {
                current = detail::rename_tokens(current, options, state);
            }
            if (options.collapse_whitespace) {
                current = collapse_whitespace(current);
            }

            if (utils::trim(current).empty()) {
                continue;
            }
            normalized.push_back(std::move(current));
        }

        // a trailing empty line does not survive split_lines on the next pass
        while (!normalized.empty() && utils::trim(normalized.back()).empty()) {
            normalized.pop_back();
        }

        debug_log("normalized {} -> {} lines"_format(lines.size(), normalized.size()));
        return utils::join_with_separator(normalized, "\n"sv);
    }

}  // namespace irdiverge
