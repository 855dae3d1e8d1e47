#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace STS::Utils {

[[nodiscard]] auto toMillis(std::chrono::system_clock::time_point tp) -> std::uint64_t;
[[nodiscard]] auto toUnixSeconds(std::chrono::system_clock::time_point tp) -> double;

// Random 128-bit identifier in canonical 8-4-4-4-12 hex form.
[[nodiscard]] auto generateUuid() -> std::string;

[[nodiscard]] auto writeFileAtomic(std::filesystem::path const& path,
                                   std::span<const std::byte> data,
                                   bool fsyncData) -> Expected<void>;
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path,
                                       std::string_view text,
                                       bool fsyncData = false) -> Expected<void>;

[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

[[nodiscard]] auto ensureParentDirectory(std::filesystem::path const& path) -> Expected<void>;

// A relative path that stays inside its base directory once joined.
[[nodiscard]] auto isContainedRelativePath(std::string_view relative) -> bool;

} // namespace STS::Utils
