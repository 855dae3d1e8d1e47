#pragma once
#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace STS::Net {
class UrlFetcher;
}

namespace STS::Schema {

using json = nlohmann::json;

/**
 * Locates the active state schema.
 *
 * The configured URL is tried first. When it cannot be fetched (or no URL is
 * configured) the newest copy in `backupDirectory` is used instead. A
 * successfully fetched schema that differs from the newest copy is written to
 * `backupDirectory` under an ISO-8601 timestamped name so that the server can
 * start offline later.
 */
class SchemaRegistry {
public:
    struct Options {
        std::string           url;
        std::filesystem::path backupDirectory;
        // Root of the schema files served to clients; empty serves none.
        std::filesystem::path publishedDirectory;
    };

    SchemaRegistry(Options options, Net::UrlFetcher* fetcher);

    [[nodiscard]] auto load(std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
        -> Expected<json>;

    // Path of the lexicographically newest *.json file in the backup directory.
    [[nodiscard]] auto newestBackup() const -> std::optional<std::filesystem::path>;

    // A schema file below the published directory, e.g. "messages/ws-incoming.json".
    // "state.json" names the schema returned by the last successful load().
    [[nodiscard]] auto readSchema(std::string_view name) const -> Expected<json>;

private:
    Options             options;
    Net::UrlFetcher*    fetcher;
    mutable std::mutex  activeMutex;
    std::optional<json> active;

    auto loadActive(std::chrono::system_clock::time_point now) -> Expected<json>;
    auto saveBackup(std::string const& text, std::chrono::system_clock::time_point now) -> Expected<std::filesystem::path>;
};

// {"version": schema.properties.version.default}
[[nodiscard]] auto defaultDocumentFor(json const& schema) -> Expected<json>;

// "2024-05-01T13_45_10.123456.json"; ':' is replaced so the name is portable.
[[nodiscard]] auto schemaBackupName(std::chrono::system_clock::time_point now) -> std::string;

} // namespace STS::Schema
