#include "irdiverge/config.hpp"

#include "internal/types.hpp"
#include "irdiverge/errors.hpp"
#include "irdiverge/format.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace irdiverge::literals;

namespace irdiverge {

    namespace fs = std::filesystem;

    namespace detail {

        inline constexpr int supported_config_schema_version = 1;

        static std::string read_config_text(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw missing_input("config file not found: {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (in.bad()) {
                throw missing_input("failed to read config file: {}"_format(path.string()));
            }
            return ss.str();
        }

        static internal::persisted_normalization to_persisted(const normalize_options& opts) {
            return internal::persisted_normalization{
                    .drop_blank_lines = opts.drop_blank_lines,
                    .drop_metadata = opts.drop_metadata,
                    .strip_comments = opts.strip_comments,
                    .strip_debug_info = opts.strip_debug_info,
                    .rename_temporaries = opts.rename_temporaries,
                    .rename_labels = opts.rename_labels,
                    .collapse_whitespace = opts.collapse_whitespace};
        }

        static normalize_options from_persisted(const internal::persisted_normalization& persisted) {
            return normalize_options{
                    .drop_blank_lines = persisted.drop_blank_lines,
                    .drop_metadata = persisted.drop_metadata,
                    .strip_comments = persisted.strip_comments,
                    .strip_debug_info = persisted.strip_debug_info,
                    .rename_temporaries = persisted.rename_temporaries,
                    .rename_labels = persisted.rename_labels,
                    .collapse_whitespace = persisted.collapse_whitespace};
        }

        static std::vector<std::string> sorted_names(const std::unordered_set<std::string>& names) {
            std::vector<std::string> out{names.begin(), names.end()};
            std::ranges::sort(out);
            return out;
        }

        static std::string_view on_off(bool value) {
            return value ? "on"sv : "off"sv;
        }

    }  // namespace detail

    void apply_config_file(const fs::path& path, analysis_config& cfg) {
        auto json = detail::read_config_text(path);

        // keys absent from the file keep their current values
        internal::persisted_config persisted{};
        persisted.normalization = detail::to_persisted(cfg.normalization);

        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(persisted, json);
        if (ec) {
            throw invalid_config(
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
        }
        if (persisted.schema_version > detail::supported_config_schema_version) {
            throw invalid_config("unsupported schema_version in {}: {} > {}"_format(
                    path.string(), persisted.schema_version, detail::supported_config_schema_version));
        }

        cfg.normalization = detail::from_persisted(persisted.normalization);
        cfg.exclusions.exclude_a.insert(persisted.exclude_a.begin(), persisted.exclude_a.end());
        cfg.exclusions.exclude_b.insert(persisted.exclude_b.begin(), persisted.exclude_b.end());
        cfg.config_path = path;
    }

    void print_config(const analysis_config& cfg, std::ostream& os) {
        const auto& norm = cfg.normalization;

        os << "legacy=" << cfg.legacy_path.string() << '\n';
        os << "npm=" << cfg.npm_path.string() << '\n';
        os << "mapping=" << cfg.mapping_path.string() << '\n';
        os << "config=" << (cfg.config_path ? cfg.config_path->string() : "<none>") << '\n';
        os << "legacy_dialect=" << to_string(cfg.legacy_dialect) << '\n';
        os << "npm_dialect=" << to_string(cfg.npm_dialect) << '\n';
        os << "output_dir=" << cfg.output_dir.string() << '\n';
        os << "normalize.drop_blank_lines=" << detail::on_off(norm.drop_blank_lines) << '\n';
        os << "normalize.drop_metadata=" << detail::on_off(norm.drop_metadata) << '\n';
        os << "normalize.strip_comments=" << detail::on_off(norm.strip_comments) << '\n';
        os << "normalize.strip_debug_info=" << detail::on_off(norm.strip_debug_info) << '\n';
        os << "normalize.rename_temporaries=" << detail::on_off(norm.rename_temporaries) << '\n';
        os << "normalize.rename_labels=" << detail::on_off(norm.rename_labels) << '\n';
        os << "normalize.collapse_whitespace=" << detail::on_off(norm.collapse_whitespace) << '\n';
        os << "exclude_legacy=" << utils::join_with_separator(detail::sorted_names(cfg.exclusions.exclude_a), ","sv)
           << '\n';
        os << "exclude_npm=" << utils::join_with_separator(detail::sorted_names(cfg.exclusions.exclude_b), ","sv)
           << '\n';
    }

}  // namespace irdiverge
