#pragma once

#include "headers.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace irdiverge {

    struct artifact_handle {
        std::string name{};
        std::filesystem::path location{};

        bool operator==(const artifact_handle&) const = default;
    };

    // Storage capability injected into extraction; `write` throws storage_fault on failure.
    class artifact_store {
      public:
        virtual ~artifact_store() = default;

        virtual artifact_handle write(std::string_view name, std::string_view bytes) = 0;
        virtual std::string read(const artifact_handle& handle) const = 0;
    };

    // One file per artifact under `root`, created on first write.
    class directory_store final : public artifact_store {
      public:
        explicit directory_store(std::filesystem::path root);

        artifact_handle write(std::string_view name, std::string_view bytes) override;
        std::string read(const artifact_handle& handle) const override;

        const std::filesystem::path& root() const noexcept { return root_; }

      private:
        std::filesystem::path root_{};
        bool root_ready_{false};
    };

    struct pass_record {
        std::string canonical_name{};
        size_t sequence_index{};
        pass_scope scope{pass_scope::unknown};
        std::optional<std::string> target{};
        artifact_handle content{};
    };

    inline constexpr size_t max_sanitized_length = 100U;
    inline constexpr auto artifact_extension = ".ll"sv;

    std::string sanitize_artifact_component(std::string_view name);

    // 001_PassName.ll, or 001_PassName_target.ll for function-scope passes
    std::string make_artifact_name(size_t ordinal, const header_descriptor& header);

    // Content of header `index`: lines after its banner up to the next banner, trailing whitespace stripped.
    std::string extract_block(const std::vector<std::string_view>& lines,
                              const std::vector<header_descriptor>& headers,
                              size_t index);

    std::vector<pass_record> extract(
            std::string_view text, const std::vector<header_descriptor>& headers, artifact_store& store);

}  // namespace irdiverge
