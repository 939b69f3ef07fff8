#include "irdiverge/extract.hpp"

#include "irdiverge/errors.hpp"

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using namespace irdiverge::literals;

namespace irdiverge {
    namespace detail {

        class scoped_fd {
          public:
            explicit scoped_fd(int fd) : fd_value(fd) {}

            scoped_fd(const scoped_fd&) = delete;
            scoped_fd& operator=(const scoped_fd&) = delete;

            ~scoped_fd() {
                if (fd_value >= 0) {
                    (void)::close(fd_value);
                }
            }

            int get() const noexcept { return fd_value; }

            // Closes now so the caller can observe the result; the destructor becomes a no-op.
            bool close() noexcept {
                auto fd = fd_value;
                fd_value = -1;
                return ::close(fd) == 0;
            }

          private:
            int fd_value{-1};
        };

        static bool is_hostile_char(char c) {
            switch (c) {
                case '<':
                case '>':
                case ':':
                case '"':
                case '/':
                case '\\':
                case '|':
                case '?':
                case '*':
                case ',':
                case '(':
                case ')':
                case '[':
                case ']':
                    return true;
                default:
                    return false;
            }
        }

        static void write_all(int fd, std::string_view bytes, const fs::path& path) {
            while (!bytes.empty()) {
                auto n = ::write(fd, bytes.data(), bytes.size());
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw storage_fault("failed to write artifact {}: {}"_format(path.string(), std::strerror(errno)));
                }
                bytes.remove_prefix(static_cast<size_t>(n));
            }
        }

    }  // namespace detail

    directory_store::directory_store(fs::path root) : root_{std::move(root)} {}

    artifact_handle directory_store::write(std::string_view name, std::string_view bytes) {
        if (!root_ready_) {
            std::error_code ec{};
            fs::create_directories(root_, ec);
            if (ec) {
                throw storage_fault("failed to create artifact directory {}: {}"_format(root_.string(), ec.message()));
            }
            root_ready_ = true;
        }

        auto path = root_ / std::string{name};
        detail::scoped_fd fd{::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644)};
        if (fd.get() < 0) {
            throw storage_fault("failed to open artifact {}: {}"_format(path.string(), std::strerror(errno)));
        }

        detail::write_all(fd.get(), bytes, path);

        if (!fd.close()) {
            throw storage_fault("failed to close artifact {}: {}"_format(path.string(), std::strerror(errno)));
        }

        return artifact_handle{.name = std::string{name}, .location = std::move(path)};
    }

    std::string directory_store::read(const artifact_handle& handle) const {
        std::ifstream in{handle.location, std::ios::binary};
        if (!in) {
            throw storage_fault("failed to open artifact {}"_format(handle.location.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (in.bad()) {
            throw storage_fault("failed to read artifact {}"_format(handle.location.string()));
        }
        return ss.str();
    }

    std::string sanitize_artifact_component(std::string_view name) {
        std::string clean{};
        clean.reserve(name.size());

        for (auto c : name) {
            if (detail::is_hostile_char(c) || utils::is_space(c)) {
                c = '_';
            }
            if (c == '_' && !clean.empty() && clean.back() == '_') {
                continue;
            }
            clean.push_back(c);
        }

        auto first = clean.find_first_not_of('_');
        if (first == std::string::npos) {
            return {};
        }
        auto last = clean.find_last_not_of('_');
        clean = clean.substr(first, (last - first) + 1U);

        if (clean.size() > max_sanitized_length) {
            clean.resize(max_sanitized_length);
        }
        return clean;
    }

    std::string make_artifact_name(size_t ordinal, const header_descriptor& header) {
        auto name = "{:03}_{}"_format(ordinal, sanitize_artifact_component(header.canonical_name));
        if (header.scope == pass_scope::function && header.target) {
            name += '_';
            name += sanitize_artifact_component(*header.target);
        }
        name += artifact_extension;
        return name;
    }

    std::string extract_block(const std::vector<std::string_view>& lines,
                              const std::vector<header_descriptor>& headers,
                              size_t index) {
        // line_number is 1-based, so it is also the 0-based index of the first content line
        auto begin = headers[index].line_number;
        auto end = index + 1U < headers.size() ? headers[index + 1U].line_number - 1U : lines.size();

        std::string block{};
        for (auto i = begin; i < end && i < lines.size(); ++i) {
            block += utils::trim_right(lines[i]);
            block += '\n';
        }
        return block;
    }

    std::vector<pass_record> extract(
            std::string_view text, const std::vector<header_descriptor>& headers, artifact_store& store) {
        auto lines = utils::split_lines(text);

        std::vector<pass_record> records{};
        records.reserve(headers.size());

        for (size_t i = 0U; i < headers.size(); ++i) {
            const auto& header = headers[i];
            auto handle = store.write(make_artifact_name(i, header), extract_block(lines, headers, i));

            records.push_back(
                    pass_record{
                            .canonical_name = header.canonical_name,
                            .sequence_index = i,
                            .scope = header.scope,
                            .target = header.scope == pass_scope::function ? header.target : std::nullopt,
                            .content = std::move(handle)});
        }
        return records;
    }

}  // namespace irdiverge
