#include "irdiverge/log.hpp"

#include "irdiverge/errors.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace irdiverge::literals;

namespace irdiverge {

    std::string format_local_time(const char* pattern, std::chrono::system_clock::time_point when) {
        auto timestamp_s = std::chrono::system_clock::to_time_t(when);

        std::tm local_tm{};
        localtime_r(&timestamp_s, &local_tm);

        std::ostringstream os{};
        os << std::put_time(&local_tm, pattern);
        return os.str();
    }

    void run_log::open_file(const std::filesystem::path& path) {
        std::lock_guard lock{mutex_};
        if (file_.is_open()) {
            file_.close();
        }
        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_) {
            throw storage_fault("failed to open log file: {}"_format(path.string()));
        }
    }

    void run_log::set_echo(bool enabled, std::ostream* stream) {
        std::lock_guard lock{mutex_};
        echo_ = enabled;
        echo_stream_ = stream;
    }

    void run_log::write(log_level level, std::string_view message) {
        auto line = "{} - {} - {}\n"_format(format_local_time("%Y-%m-%d %H:%M:%S"), level, message);

        std::lock_guard lock{mutex_};
        ++counts_[static_cast<size_t>(level)];

        if (file_.is_open()) {
            file_ << line;
            file_.flush();
        }
        if (echo_) {
            auto& os = echo_stream_ != nullptr ? *echo_stream_ : std::cerr;
            os << line;
        }
    }

    size_t run_log::count(log_level level) const {
        std::lock_guard lock{mutex_};
        return counts_[static_cast<size_t>(level)];
    }

}  // namespace irdiverge
