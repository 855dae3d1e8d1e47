#pragma once
#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace STS::History {

using json = nlohmann::json;

struct BackupSnapshot {
    double timestamp = 0.0; // Unix seconds
    json   document;
};

/**
 * Timestamped snapshots of the committed document in one JSON file:
 *
 *   { "1714560000.123456": "<serialized document>", ... }
 *
 * Every write drops entries older than the retention interval before adding
 * the new one. A missing or unreadable file starts an empty mapping.
 */
class BackupStore {
public:
    struct Options {
        std::filesystem::path file;
        std::chrono::seconds  retention{std::chrono::hours{24}};
    };

    explicit BackupStore(Options options);

    // Returns the number of entries pruned.
    auto write(json const& document,
               std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) -> Expected<std::size_t>;

    [[nodiscard]] auto load() const -> Expected<json>;
    [[nodiscard]] auto latest() const -> Expected<std::optional<BackupSnapshot>>;

    [[nodiscard]] auto file() const -> std::filesystem::path const& { return options.file; }

private:
    Options options;

    [[nodiscard]] auto readMapping() const -> json;
};

[[nodiscard]] auto backupKeyFor(std::chrono::system_clock::time_point tp) -> std::string;
[[nodiscard]] auto parseBackupKey(std::string const& key) -> std::optional<double>;

} // namespace STS::History
