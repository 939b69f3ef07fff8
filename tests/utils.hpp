#pragma once

#include "irdiverge/align.hpp"
#include "irdiverge/analyzer.hpp"
#include "irdiverge/config.hpp"
#include "irdiverge/diff.hpp"
#include "irdiverge/divergence.hpp"
#include "irdiverge/errors.hpp"
#include "irdiverge/extract.hpp"
#include "irdiverge/headers.hpp"
#include "irdiverge/log.hpp"
#include "irdiverge/mapping.hpp"
#include "irdiverge/normalize.hpp"
#include "irdiverge/report.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace irdiverge::test {
    namespace fs = std::filesystem;
    using namespace std::string_view_literals;
    using namespace irdiverge::literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // Keeps artifacts in memory and counts reads per artifact name
    class memory_store final : public artifact_store {
      public:
        artifact_handle write(std::string_view name, std::string_view bytes) override {
            if (fail_writes) {
                throw storage_fault("memory store rejects writes");
            }
            std::string key{name};
            blobs_[key] = std::string{bytes};
            order_.push_back(key);
            return artifact_handle{.name = key, .location = fs::path{"mem"} / key};
        }

        std::string read(const artifact_handle& handle) const override {
            ++reads_[handle.name];
            auto it = blobs_.find(handle.name);
            if (it == blobs_.end()) {
                throw storage_fault("no artifact named {}"_format(handle.name));
            }
            return it->second;
        }

        size_t read_count(std::string_view name) const {
            auto it = reads_.find(std::string{name});
            return it == reads_.end() ? 0U : it->second;
        }

        const std::vector<std::string>& write_order() const { return order_; }

        bool fail_writes{false};

      private:
        std::map<std::string, std::string> blobs_{};
        std::vector<std::string> order_{};
        mutable std::map<std::string, size_t> reads_{};
    };

    // Builds a record whose content lives in `store` under `name`
    inline pass_record make_record(
            memory_store& store, std::string_view pass, size_t index, std::string_view content, std::string_view name) {
        return pass_record{
                .canonical_name = std::string{pass},
                .sequence_index = index,
                .scope = pass_scope::unknown,
                .target = std::nullopt,
                .content = store.write(name, content)};
    }

}  // namespace irdiverge::test
