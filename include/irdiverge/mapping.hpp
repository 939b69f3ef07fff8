#pragma once

#include "align.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace irdiverge {

    // Parses a JSON object of pass-name strings; throws malformed_mapping on anything else.
    name_mapping parse_name_mapping(std::string_view json);

    // Throws missing_input when the file cannot be read, malformed_mapping when it cannot be parsed.
    name_mapping load_name_mapping(const std::filesystem::path& path);

    // Pipeline B names targeted by more than one pipeline A name, sorted.
    std::vector<std::string> find_ambiguous_targets(const name_mapping& mapping);

}  // namespace irdiverge
