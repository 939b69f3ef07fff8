#include "irdiverge/diff.hpp"

#include <algorithm>
#include <cstddef>

using namespace irdiverge::literals;

namespace irdiverge::diff {
    namespace detail {

        using index_t = std::ptrdiff_t;

        // v values for diagonals [-d, d] as they stood before step d
        struct trace_step {
            index_t d{};
            std::vector<index_t> v{};

            index_t at(index_t k) const { return v[static_cast<size_t>(k + d)]; }
        };

        static bool take_down(index_t k, index_t d, const auto& v_at) {
            return k == -d || (k != d && v_at(k - 1) < v_at(k + 1));
        }

        static std::string format_range(size_t start, size_t length) {
            if (length == 1U) {
                return "{}"_format(start + 1U);
            }
            if (length == 0U) {
                return "{},0"_format(start);
            }
            return "{},{}"_format(start + 1U, length);
        }

    }  // namespace detail

    std::vector<edit_op> diff_lines(const std::vector<std::string_view>& a, const std::vector<std::string_view>& b) {
        using detail::index_t;

        auto n = static_cast<index_t>(a.size());
        auto m = static_cast<index_t>(b.size());
        auto max = n + m;
        auto offset = max + 1;

        std::vector<index_t> v(static_cast<size_t>(2 * max + 3), 0);
        auto v_at = [&](index_t k) -> index_t& { return v[static_cast<size_t>(k + offset)]; };

        std::vector<detail::trace_step> trace{};
        bool done = false;

        for (index_t d = 0; d <= max && !done; ++d) {
            detail::trace_step step{.d = d};
            step.v.reserve(static_cast<size_t>(2 * d + 1));
            for (auto k = -d; k <= d; ++k) {
                step.v.push_back(v_at(k));
            }
            trace.push_back(std::move(step));

            for (auto k = -d; k <= d; k += 2) {
                index_t x = detail::take_down(k, d, v_at) ? v_at(k + 1) : v_at(k - 1) + 1;
                index_t y = x - k;
                while (x < n && y < m && a[static_cast<size_t>(x)] == b[static_cast<size_t>(y)]) {
                    ++x;
                    ++y;
                }
                v_at(k) = x;
                if (x >= n && y >= m) {
                    done = true;
                    break;
                }
            }
        }

        std::vector<edit_op> ops{};
        auto x = n;
        auto y = m;
        for (auto d = static_cast<index_t>(trace.size()) - 1; d >= 0; --d) {
            const auto& step = trace[static_cast<size_t>(d)];
            auto step_at = [&](index_t k) { return step.at(k); };

            auto k = x - y;
            auto prev_k = detail::take_down(k, d, step_at) ? k + 1 : k - 1;
            auto prev_x = d == 0 ? 0 : step.at(prev_k);
            auto prev_y = prev_x - prev_k;

            while (x > prev_x && y > prev_y) {
                --x;
                --y;
                ops.push_back(edit_op{
                        .kind = edit_kind::equal, .a_pos = static_cast<size_t>(x), .b_pos = static_cast<size_t>(y)});
            }
            if (d > 0) {
                if (x == prev_x) {
                    --y;
                    ops.push_back(edit_op{
                            .kind = edit_kind::insert, .a_pos = static_cast<size_t>(x), .b_pos = static_cast<size_t>(y)});
                }
                else {
                    --x;
                    ops.push_back(edit_op{
                            .kind = edit_kind::remove, .a_pos = static_cast<size_t>(x), .b_pos = static_cast<size_t>(y)});
                }
            }
            x = prev_x;
            y = prev_y;
        }

        std::ranges::reverse(ops);
        return ops;
    }

    std::string unified_diff(std::string_view a_text,
                             std::string_view b_text,
                             std::string_view from_label,
                             std::string_view to_label,
                             size_t context) {
        auto a = utils::split_lines(a_text);
        auto b = utils::split_lines(b_text);
        auto ops = diff_lines(a, b);

        std::vector<size_t> changes{};
        for (size_t i = 0U; i < ops.size(); ++i) {
            if (ops[i].kind != edit_kind::equal) {
                changes.push_back(i);
            }
        }
        if (changes.empty()) {
            return {};
        }

        std::string out{};
        out += "--- {}\n"_format(from_label);
        out += "+++ {}\n"_format(to_label);

        size_t group_begin = 0U;
        while (group_begin < changes.size()) {
            auto group_end = group_begin;
            // changes separated by more than 2 * context equal lines start a new hunk
            while (group_end + 1U < changes.size() &&
                   changes[group_end + 1U] - changes[group_end] <= 2U * context + 1U) {
                ++group_end;
            }

            auto first = changes[group_begin] > context ? changes[group_begin] - context : 0U;
            auto last = std::min(ops.size(), changes[group_end] + context + 1U);

            size_t a_len = 0U;
            size_t b_len = 0U;
            for (auto i = first; i < last; ++i) {
                if (ops[i].kind != edit_kind::insert) {
                    ++a_len;
                }
                if (ops[i].kind != edit_kind::remove) {
                    ++b_len;
                }
            }

            out += "@@ -{} +{} @@\n"_format(
                    detail::format_range(ops[first].a_pos, a_len), detail::format_range(ops[first].b_pos, b_len));

            for (auto i = first; i < last; ++i) {
                const auto& op = ops[i];
                switch (op.kind) {
                    case edit_kind::equal:
                        out += ' ';
                        out += a[op.a_pos];
                        break;
                    case edit_kind::remove:
                        out += '-';
                        out += a[op.a_pos];
                        break;
                    case edit_kind::insert:
                        out += '+';
                        out += b[op.b_pos];
                        break;
                }
                out += '\n';
            }

            group_begin = group_end + 1U;
        }
        return out;
    }

}  // namespace irdiverge::diff
