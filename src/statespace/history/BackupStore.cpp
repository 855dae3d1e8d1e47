#include "history/BackupStore.hpp"
#include "log/TaggedLogger.hpp"
#include "utils/FileUtils.hpp"

#include <charconv>
#include <cstdio>
#include <vector>

namespace STS::History {

BackupStore::BackupStore(Options options)
    : options(std::move(options)) {}

auto backupKeyFor(std::chrono::system_clock::time_point tp) -> std::string {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    char buffer[32];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%lld.%06lld",
                  static_cast<long long>(micros / 1000000),
                  static_cast<long long>(micros % 1000000));
    return buffer;
}

auto parseBackupKey(std::string const& key) -> std::optional<double> {
    double value = 0.0;
    auto   end   = key.data() + key.size();
    auto   res   = std::from_chars(key.data(), end, value);
    if (key.empty() || res.ec != std::errc{} || res.ptr != end)
        return std::nullopt;
    return value;
}

auto BackupStore::readMapping() const -> json {
    auto text = Utils::readTextFile(this->options.file);
    if (!text)
        return json::object();
    try {
        auto parsed = json::parse(*text);
        if (parsed.is_object())
            return parsed;
    } catch (json::parse_error const& e) {
        sts_log("Discarding unreadable backup file " + this->options.file.string() + ": " + e.what(),
                "Backup",
                "Error");
    }
    return json::object();
}

auto BackupStore::write(json const& document, std::chrono::system_clock::time_point now) -> Expected<std::size_t> {
    auto       backups = this->readMapping();
    auto const nowSecs = Utils::toUnixSeconds(now);
    auto const window  = static_cast<double>(this->options.retention.count());

    std::vector<std::string> expired;
    for (auto const& [key, _] : backups.items()) {
        auto stamp = parseBackupKey(key);
        if (!stamp || nowSecs - *stamp > window)
            expired.push_back(key);
    }
    for (auto const& key : expired)
        backups.erase(key);

    backups[backupKeyFor(now)] = document.dump();

    if (auto written = Utils::writeTextFileAtomic(this->options.file, backups.dump()); !written)
        return std::unexpected(written.error());
    return expired.size();
}

auto BackupStore::load() const -> Expected<json> {
    auto text = Utils::readTextFile(this->options.file);
    if (!text) {
        if (text.error().code == Error::Code::NotFound)
            return json::object();
        return std::unexpected(text.error());
    }
    try {
        auto parsed = json::parse(*text);
        if (!parsed.is_object())
            return std::unexpected(Error{Error::Code::MalformedInput, "Backup file is not a JSON object"});
        return parsed;
    } catch (json::parse_error const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"Backup file is not valid JSON: "} + e.what()});
    }
}

auto BackupStore::latest() const -> Expected<std::optional<BackupSnapshot>> {
    auto backups = this->load();
    if (!backups)
        return std::unexpected(backups.error());

    std::optional<std::pair<double, std::string const*>> newest;
    for (auto const& [key, value] : backups->items()) {
        auto stamp = parseBackupKey(key);
        if (!stamp || !value.is_string())
            continue;
        if (!newest || *stamp > newest->first)
            newest = std::make_pair(*stamp, &value.get_ref<std::string const&>());
    }
    if (!newest)
        return std::optional<BackupSnapshot>{};

    try {
        return std::optional<BackupSnapshot>{BackupSnapshot{newest->first, json::parse(*newest->second)}};
    } catch (json::parse_error const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"Backup snapshot is not valid JSON: "} + e.what()});
    }
}

} // namespace STS::History
