#include "irdiverge/mapping.hpp"

#include "irdiverge/errors.hpp"
#include "irdiverge/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace irdiverge::literals;

namespace irdiverge {

    name_mapping parse_name_mapping(std::string_view json) {
        std::string buffer{json};
        name_mapping mapping{};
        auto ec = glz::read_json(mapping, buffer);
        if (ec) {
            throw malformed_mapping("invalid pass mapping json: {}"_format(glz::format_error(ec, buffer)));
        }
        return mapping;
    }

    name_mapping load_name_mapping(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw missing_input("pass mapping file not found: {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (in.bad()) {
            throw missing_input("failed to read pass mapping file: {}"_format(path.string()));
        }

        try {
            return parse_name_mapping(ss.str());
        } catch (const malformed_mapping& e) {
            throw malformed_mapping("{}: {}"_format(path.string(), e.what()));
        }
    }

    std::vector<std::string> find_ambiguous_targets(const name_mapping& mapping) {
        std::map<std::string_view, size_t> target_counts{};
        for (const auto& [source, target] : mapping) {
            if (!target.empty()) {
                ++target_counts[target];
            }
        }

        std::vector<std::string> duplicates{};
        for (const auto& [target, count] : target_counts) {
            if (count > 1U) {
                duplicates.emplace_back(target);
            }
        }
        return duplicates;
    }

}  // namespace irdiverge
