#include "schema/SchemaRegistry.hpp"
#include "log/TaggedLogger.hpp"
#include "net/UrlFetcher.hpp"
#include "utils/FileUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace STS::Schema {

namespace {

auto parseSchemaText(std::string const& text, std::string const& origin) -> Expected<json> {
    try {
        auto parsed = json::parse(text);
        if (!parsed.is_object()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Schema " + origin + " is not a JSON object"});
        }
        return parsed;
    } catch (json::parse_error const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "Schema " + origin + " is not valid JSON: " + std::string{e.what()}});
    }
}

} // namespace

SchemaRegistry::SchemaRegistry(Options options, Net::UrlFetcher* fetcher)
    : options(std::move(options)), fetcher(fetcher) {}

auto SchemaRegistry::newestBackup() const -> std::optional<std::filesystem::path> {
    std::error_code ec;
    if (this->options.backupDirectory.empty() || !std::filesystem::is_directory(this->options.backupDirectory, ec))
        return std::nullopt;

    std::optional<std::filesystem::path> newest;
    for (auto const& entry : std::filesystem::directory_iterator(this->options.backupDirectory, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".json")
            continue;
        if (!newest || entry.path().filename() > newest->filename())
            newest = entry.path();
    }
    return newest;
}

auto SchemaRegistry::load(std::chrono::system_clock::time_point now) -> Expected<json> {
    auto loaded = this->loadActive(now);
    if (loaded) {
        std::lock_guard<std::mutex> lock(this->activeMutex);
        this->active = *loaded;
    }
    return loaded;
}

auto SchemaRegistry::readSchema(std::string_view name) const -> Expected<json> {
    while (!name.empty() && name.back() == '/')
        name.remove_suffix(1);
    if (name == "state.json") {
        std::lock_guard<std::mutex> lock(this->activeMutex);
        if (this->active)
            return *this->active;
        return std::unexpected(Error{Error::Code::NotFound, "No state schema has been loaded"});
    }

    std::filesystem::path relative{std::string{name}};
    if (!Utils::isContainedRelativePath(name) || relative.extension() != ".json")
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid schema name '" + std::string{name} + "'"});
    if (this->options.publishedDirectory.empty())
        return std::unexpected(Error{Error::Code::NotFound, "No schema directory configured"});

    auto const path = this->options.publishedDirectory / relative;
    auto       text = Utils::readTextFile(path);
    if (!text)
        return std::unexpected(text.error());
    return parseSchemaText(*text, path.string());
}

auto SchemaRegistry::loadActive(std::chrono::system_clock::time_point now) -> Expected<json> {
    auto backupPath = this->newestBackup();

    if (!this->options.url.empty() && this->fetcher != nullptr) {
        auto fetched = this->fetcher->fetch(this->options.url);
        if (fetched) {
            auto schema = parseSchemaText(*fetched, this->options.url);
            if (schema) {
                bool needBackup = true;
                if (backupPath) {
                    auto existing = Utils::readTextFile(*backupPath);
                    if (existing && *existing == *fetched)
                        needBackup = false;
                }
                if (needBackup && !this->options.backupDirectory.empty()) {
                    if (auto saved = this->saveBackup(*fetched, now); !saved) {
                        sts_log("Unable to save schema backup: " + describeError(saved.error()), "Schema", "Error");
                    }
                }
                return schema;
            }
            sts_log(describeError(schema.error()), "Schema", "Error");
        } else {
            sts_log("Unable to load schema from " + this->options.url + ": " + describeError(fetched.error()),
                    "Schema",
                    "Error");
        }
    }

    if (!backupPath) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "No state schema available from '" + this->options.url + "' or in "
                                         + this->options.backupDirectory.string()});
    }
    sts_log("Using backup schema " + backupPath->string(), "Schema", "INFO");
    auto text = Utils::readTextFile(*backupPath);
    if (!text)
        return std::unexpected(text.error());
    return parseSchemaText(*text, backupPath->string());
}

auto SchemaRegistry::saveBackup(std::string const& text, std::chrono::system_clock::time_point now)
    -> Expected<std::filesystem::path> {
    auto path = this->options.backupDirectory / schemaBackupName(now);
    if (auto written = Utils::writeTextFileAtomic(path, text); !written)
        return std::unexpected(written.error());
    sts_log("Saved backup schema to " + path.string(), "Schema", "INFO");
    return path;
}

auto defaultDocumentFor(json const& schema) -> Expected<json> {
    auto properties = schema.find("properties");
    if (properties == schema.end() || !properties->is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "Schema has no properties"});
    auto version = properties->find("version");
    if (version == properties->end() || !version->is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "Schema does not describe a version property"});
    auto def = version->find("default");
    if (def == version->end())
        return std::unexpected(Error{Error::Code::MalformedInput, "Schema version property has no default"});
    return json{{"version", *def}};
}

auto schemaBackupName(std::chrono::system_clock::time_point now) -> std::string {
    auto const timeT  = std::chrono::system_clock::to_time_t(now);
    auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::tm    tm{};
    localtime_r(&timeT, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H_%M_%S") << '.' << std::setfill('0') << std::setw(6) << micros.count()
        << ".json";
    return oss.str();
}

} // namespace STS::Schema
