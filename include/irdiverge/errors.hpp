#pragma once

#include "format.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace irdiverge {

    using namespace std::string_view_literals;

    // Fatal error kinds; each one terminates the run with a single surfaced error.
    enum class error_kind : uint8_t {
        missing_input,
        malformed_mapping,
        storage_fault,
        invalid_config,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::missing_input:
                return "missing_input"sv;
            case error_kind::malformed_mapping:
                return "malformed_mapping"sv;
            case error_kind::storage_fault:
                return "storage_fault"sv;
            case error_kind::invalid_config:
                return "invalid_config"sv;
        }
        return "invalid_config"sv;
    }

    class analysis_error : public std::runtime_error {
      public:
        analysis_error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        [[nodiscard]] error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

    class missing_input : public analysis_error {
      public:
        explicit missing_input(const std::string& message) : analysis_error{error_kind::missing_input, message} {}
    };

    class malformed_mapping : public analysis_error {
      public:
        explicit malformed_mapping(const std::string& message)
                : analysis_error{error_kind::malformed_mapping, message} {}
    };

    class storage_fault : public analysis_error {
      public:
        explicit storage_fault(const std::string& message) : analysis_error{error_kind::storage_fault, message} {}
    };

    class invalid_config : public analysis_error {
      public:
        explicit invalid_config(const std::string& message) : analysis_error{error_kind::invalid_config, message} {}
    };

}  // namespace irdiverge
