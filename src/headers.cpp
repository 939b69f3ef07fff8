#include "irdiverge/headers.hpp"

#include "irdiverge/errors.hpp"

#include <istream>
#include <string>

using namespace irdiverge::literals;

namespace irdiverge {
    namespace detail {

        static std::optional<header_descriptor> match_legacy_header(std::string_view line) {
            auto rest = utils::trim_left(line);
            if (!rest.empty() && rest.front() == '#') {
                rest = utils::trim_left(rest.substr(1U));
            }
            if (!rest.starts_with(banner::legacy_prefix)) {
                return std::nullopt;
            }

            auto body = rest.substr(banner::legacy_prefix.size());
            auto end = body.rfind(banner::terminator);
            if (end == std::string_view::npos || end == 0U) {
                return std::nullopt;
            }

            auto text = utils::trim(body.substr(0U, end));
            header_descriptor header{};
            header.canonical_name = last_parenthesized_group(text);
            header.scope = pass_scope::unknown;
            return header;
        }

        static std::optional<header_descriptor> match_npm_header(std::string_view line) {
            auto rest = utils::trim_left(line);
            if (!rest.starts_with(banner::npm_prefix)) {
                return std::nullopt;
            }

            auto body = rest.substr(banner::npm_prefix.size());

            // name is the shortest prefix followed by " on <target> ***"
            auto on = body.find(banner::target_separator, 1U);
            while (on != std::string_view::npos) {
                auto target_begin = on + banner::target_separator.size();
                auto target_end = body.find(banner::terminator, target_begin + 1U);
                if (target_end != std::string_view::npos) {
                    auto name = utils::trim(body.substr(0U, on));
                    auto target = utils::trim(body.substr(target_begin, target_end - target_begin));

                    header_descriptor header{};
                    header.canonical_name = std::string{name};
                    if (target == banner::module_marker) {
                        header.scope = pass_scope::module;
                    }
                    else {
                        header.scope = pass_scope::function;
                        header.target = std::string{target};
                    }
                    return header;
                }
                on = body.find(banner::target_separator, on + 1U);
            }
            return std::nullopt;
        }

    }  // namespace detail

    std::string last_parenthesized_group(std::string_view text) {
        std::optional<std::string_view> last{};

        size_t cursor = 0U;
        while (cursor < text.size()) {
            auto open = text.find('(', cursor);
            if (open == std::string_view::npos) {
                break;
            }
            auto close = text.find(')', open + 1U);
            if (close == std::string_view::npos) {
                break;
            }
            if (close == open + 1U) {
                cursor = open + 1U;
                continue;
            }
            last = text.substr(open + 1U, close - open - 1U);
            cursor = close + 1U;
        }

        if (last) {
            return std::string{utils::trim(*last)};
        }
        return std::string{utils::trim(text)};
    }

    std::optional<header_descriptor> match_header(std::string_view line, dump_dialect dialect, size_t line_number) {
        line = utils::trim_right(line);

        std::optional<header_descriptor> header{};
        switch (dialect) {
            case dump_dialect::legacy:
                header = detail::match_legacy_header(line);
                break;
            case dump_dialect::npm:
                header = detail::match_npm_header(line);
                break;
        }

        if (header) {
            header->line_number = line_number;
            header->line_text = std::string{line};
        }
        return header;
    }

    std::vector<header_descriptor> scan_headers(std::string_view text, dump_dialect dialect) {
        std::vector<header_descriptor> headers{};
        auto lines = utils::split_lines(text);
        for (size_t i = 0U; i < lines.size(); ++i) {
            if (auto header = match_header(lines[i], dialect, i + 1U)) {
                debug_log("{} header at line {}: {}"_format(dialect, i + 1U, header->canonical_name));
                headers.push_back(std::move(*header));
            }
        }
        return headers;
    }

    std::vector<header_descriptor> scan_headers(std::istream& in, dump_dialect dialect) {
        std::vector<header_descriptor> headers{};
        std::string line{};
        size_t line_number = 0U;

        while (std::getline(in, line)) {
            ++line_number;
            if (auto header = match_header(line, dialect, line_number)) {
                headers.push_back(std::move(*header));
            }
        }

        if (in.bad()) {
            throw missing_input("failed to read {} dump at line {}"_format(dialect, line_number + 1U));
        }
        return headers;
    }

}  // namespace irdiverge
