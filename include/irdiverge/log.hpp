#pragma once

#include "format.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace irdiverge {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warning, error };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "DEBUG"sv;
            case log_level::info:
                return "INFO"sv;
            case log_level::warning:
                return "WARNING"sv;
            case log_level::error:
                return "ERROR"sv;
        }
        return "INFO"sv;
    }

    // strftime-style `pattern` applied to local time
    std::string format_local_time(
            const char* pattern, std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    /*
     * Run-scoped log context. One instance per analysis run, passed by reference to whatever needs it.
     * Lines go to an optional file sink and, when echo is on, to the echo stream (stderr by default).
     * Writes are serialized so both extraction tasks can log.
     */
    class run_log {
      public:
        run_log() = default;

        run_log(const run_log&) = delete;
        run_log& operator=(const run_log&) = delete;

        // Truncates `path`; throws storage_fault when it cannot be opened.
        void open_file(const std::filesystem::path& path);

        void set_echo(bool enabled, std::ostream* stream = nullptr);

        void write(log_level level, std::string_view message);

        void debug(std::string_view message) { write(log_level::debug, message); }
        void info(std::string_view message) { write(log_level::info, message); }
        void warning(std::string_view message) { write(log_level::warning, message); }
        void error(std::string_view message) { write(log_level::error, message); }

        [[nodiscard]] size_t count(log_level level) const;

      private:
        mutable std::mutex mutex_{};
        std::ofstream file_{};
        bool echo_{false};
        std::ostream* echo_stream_{nullptr};
        std::array<size_t, 4> counts_{};
    };

}  // namespace irdiverge
