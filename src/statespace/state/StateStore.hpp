#pragma once
#include "core/Error.hpp"
#include "core/StatePath.hpp"
#include "history/BackupStore.hpp"
#include "history/DiffJournal.hpp"
#include "schema/SchemaValidator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace STS::Notify {
class Notifier;
}
namespace STS::Asset {
class AssetResolver;
}

namespace STS {

using json = nlohmann::json;

struct StateStoreOptions {
    json                  schema;
    // Empty means {"version": schema.properties.version.default}.
    std::optional<json>   defaultDocument;
    std::filesystem::path backupFile;
    std::chrono::seconds  backupRetention{std::chrono::hours{24}};
    std::size_t           historyLimit   = 256;
    bool                  downloadAssets = true;
};

/**
 * The shared document.
 *
 * Reads see only the committed document. Writes go to a pending copy that is
 * validated against the schema before it replaces the committed one; the
 * change is journaled as a diff so it can be undone and redone. After each
 * commit subscribers are told about the new state, and any asset the
 * document references that is not available locally is resolved.
 *
 * editMutex serializes the pending copy from mutation through commit.
 * documentMutex guards the committed document, the journal and the backup
 * file. Broadcasts and asset resolution run with neither held.
 */
class StateStore {
public:
    static auto Create(StateStoreOptions options, Notify::Notifier& notifier, Asset::AssetResolver* assets)
        -> Expected<std::unique_ptr<StateStore>>;

    StateStore(StateStore const&)            = delete;
    StateStore& operator=(StateStore const&) = delete;

    [[nodiscard]] auto get(StatePath const& path) const -> std::optional<json>;

    auto set(StatePath const& path, json value) -> Expected<void>;
    auto remove(StatePath const& path) -> Expected<void>;
    auto removeAll(std::string const& key) -> Expected<void>;

    auto undo() -> Expected<void>;
    auto redo() -> Expected<void>;

    [[nodiscard]] auto snapshot() const -> json;
    [[nodiscard]] auto defaultDocument() const -> json const& { return this->defaultDoc; }
    [[nodiscard]] auto historyStats() const -> History::DiffJournal::Stats;
    [[nodiscard]] auto backups() const -> History::BackupStore const& { return this->backupStore; }

    // Asset identifiers referenced by `document` that it does not define locally.
    [[nodiscard]] static auto unresolvedAssetReferences(json const& document) -> std::vector<std::string>;

private:
    StateStore(StateStoreOptions options, json defaultDocument, Notify::Notifier& notifier, Asset::AssetResolver* assets);

    auto commitPending() -> Expected<void>;
    void resolveReferencedAssets();

    StateStoreOptions       options;
    Schema::SchemaValidator validator;
    json                    defaultDoc;
    Notify::Notifier&       notifier;
    Asset::AssetResolver*   assets;

    std::mutex editMutex;
    json       pending;

    mutable std::mutex   documentMutex;
    json                 committed;
    History::DiffJournal journal;
    History::BackupStore backupStore;
};

} // namespace STS
