#include "state/StateStore.hpp"
#include "asset/AssetPipeline.hpp"
#include "core/DocumentTree.hpp"
#include "log/TaggedLogger.hpp"
#include "notify/Notifier.hpp"
#include "schema/SchemaRegistry.hpp"
#include "utils/FileUtils.hpp"

#include <set>

namespace STS {

auto StateStore::Create(StateStoreOptions options, Notify::Notifier& notifier, Asset::AssetResolver* assets)
    -> Expected<std::unique_ptr<StateStore>> {
    json initial;
    if (options.defaultDocument) {
        initial = *options.defaultDocument;
    } else {
        auto derived = Schema::defaultDocumentFor(options.schema);
        if (!derived)
            return std::unexpected(derived.error());
        initial = std::move(*derived);
    }
    if (auto violation = Schema::validateInstance(options.schema, initial)) {
        auto error = Schema::violationToError(*violation);
        error.message = "Default document is invalid: " + error.message.value_or("");
        return std::unexpected(std::move(error));
    }
    sts_log("Using state schema version " + initial.value("version", json{}).dump(), "StateStore", "INFO");
    return std::unique_ptr<StateStore>(new StateStore(std::move(options), std::move(initial), notifier, assets));
}

StateStore::StateStore(StateStoreOptions opts, json defaultDocument, Notify::Notifier& notifier, Asset::AssetResolver* assets)
    : options(std::move(opts)),
      validator(this->options.schema),
      defaultDoc(std::move(defaultDocument)),
      notifier(notifier),
      assets(assets),
      pending(this->defaultDoc),
      committed(this->defaultDoc),
      journal(History::DiffJournal::RetentionPolicy{.maxEntries = this->options.historyLimit}),
      backupStore(History::BackupStore::Options{.file = this->options.backupFile, .retention = this->options.backupRetention}) {}

auto StateStore::get(StatePath const& path) const -> std::optional<json> {
    std::lock_guard<std::mutex> lock(this->documentMutex);
    if (auto const* node = Tree::find(this->committed, path))
        return *node;
    return std::nullopt;
}

auto StateStore::snapshot() const -> json {
    std::lock_guard<std::mutex> lock(this->documentMutex);
    return this->committed;
}

auto StateStore::historyStats() const -> History::DiffJournal::Stats {
    std::lock_guard<std::mutex> lock(this->documentMutex);
    return this->journal.stats();
}

auto StateStore::set(StatePath const& path, json value) -> Expected<void> {
    {
        std::lock_guard<std::mutex> edit(this->editMutex);
        if (auto assigned = Tree::assign(this->pending, path, std::move(value)); !assigned)
            return assigned;
        if (auto result = this->commitPending(); !result)
            return result;
    }
    this->notifier.broadcast(Notify::Notification{Notify::NotificationTarget::State});
    this->resolveReferencedAssets();
    return {};
}

auto StateStore::remove(StatePath const& path) -> Expected<void> {
    {
        std::lock_guard<std::mutex> edit(this->editMutex);
        if (path.empty())
            this->pending = this->defaultDoc;
        else
            Tree::erase(this->pending, path);
        if (auto result = this->commitPending(); !result)
            return result;
    }
    this->notifier.broadcast(Notify::Notification{Notify::NotificationTarget::State});
    this->resolveReferencedAssets();
    return {};
}

auto StateStore::removeAll(std::string const& key) -> Expected<void> {
    {
        std::lock_guard<std::mutex> edit(this->editMutex);
        {
            std::lock_guard<std::mutex> doc(this->documentMutex);
            this->pending = this->committed;
        }
        [[maybe_unused]] auto removed = Tree::eraseKeyEverywhere(this->pending, key);
        sts_log("removeAll('" + key + "') removed " + std::to_string(removed) + " entries", "StateStore", "Debug");
        if (auto result = this->commitPending(); !result)
            return result;
    }
    this->notifier.broadcast(Notify::Notification{Notify::NotificationTarget::State});
    this->resolveReferencedAssets();
    return {};
}

auto StateStore::commitPending() -> Expected<void> {
    if (auto violation = this->validator.validate(this->pending)) {
        std::lock_guard<std::mutex> doc(this->documentMutex);
        this->pending = this->committed;
        auto error    = Schema::violationToError(*violation);
        sts_log(errorMessage(error), "StateStore", "Error");
        return std::unexpected(std::move(error));
    }

    std::lock_guard<std::mutex> doc(this->documentMutex);
    if (!this->backupStore.file().empty()) {
        if (auto written = this->backupStore.write(this->pending); !written) {
            sts_log("Backup failed: " + describeError(written.error()), "StateStore", "Error");
        }
    }

    auto diff = History::StateDiff::between(this->committed, this->pending);
    if (!diff.empty()) {
        this->journal.append(std::move(diff), Utils::toMillis(std::chrono::system_clock::now()));
        this->committed = this->pending;
    }
    return {};
}

auto StateStore::undo() -> Expected<void> {
    {
        std::lock_guard<std::mutex> edit(this->editMutex);
        std::lock_guard<std::mutex> doc(this->documentMutex);
        auto entry = this->journal.undo();
        if (!entry)
            return std::unexpected(Error{Error::Code::EmptyHistory, "Nothing to undo"});
        auto restored = this->committed;
        if (auto applied = entry->get().diff.applyInverse(restored); !applied) {
            static_cast<void>(this->journal.redo());
            return applied;
        }
        this->committed = std::move(restored);
        this->pending   = this->committed;
    }
    this->notifier.broadcast(Notify::Notification{Notify::NotificationTarget::State});
    return {};
}

auto StateStore::redo() -> Expected<void> {
    {
        std::lock_guard<std::mutex> edit(this->editMutex);
        std::lock_guard<std::mutex> doc(this->documentMutex);
        auto entry = this->journal.redo();
        if (!entry)
            return std::unexpected(Error{Error::Code::EmptyHistory, "Nothing to redo"});
        auto restored = this->committed;
        if (auto applied = entry->get().diff.applyForward(restored); !applied) {
            static_cast<void>(this->journal.undo());
            return applied;
        }
        this->committed = std::move(restored);
        this->pending   = this->committed;
    }
    this->notifier.broadcast(Notify::Notification{Notify::NotificationTarget::State});
    return {};
}

auto StateStore::unresolvedAssetReferences(json const& document) -> std::vector<std::string> {
    json const* local = nullptr;
    if (document.is_object()) {
        if (auto it = document.find("localVisAssets"); it != document.end() && it->is_object())
            local = &*it;
    }

    auto nodes = Tree::collect(document, [local](json const& node) {
        if (!node.is_object())
            return false;
        auto value = node.find("inputValue");
        auto genre = node.find("inputGenre");
        if (value == node.end() || genre == node.end() || !value->is_string() || *genre != "VisAsset")
            return false;
        return local == nullptr || !local->contains(value->get<std::string>());
    });

    std::vector<std::string> identifiers;
    std::set<std::string>    seen;
    for (auto const* node : nodes) {
        auto identifier = (*node)["inputValue"].get<std::string>();
        if (seen.insert(identifier).second)
            identifiers.push_back(std::move(identifier));
    }
    return identifiers;
}

void StateStore::resolveReferencedAssets() {
    if (!this->options.downloadAssets || this->assets == nullptr)
        return;

    std::vector<std::string> identifiers;
    {
        std::lock_guard<std::mutex> doc(this->documentMutex);
        identifiers = unresolvedAssetReferences(this->committed);
    }
    if (identifiers.empty())
        return;

    Asset::FailedFiles failures;
    for (auto const& identifier : identifiers) {
        auto failed = this->assets->resolve(identifier);
        failures.insert(failures.end(), failed.begin(), failed.end());
    }
    if (!failures.empty()) {
        std::string listing;
        for (auto const& path : failures)
            listing += "\n  " + path.string();
        sts_log("Failed to download assets:" + listing, "StateStore", "Error");
    }
    this->notifier.broadcast(Notify::Notification{Notify::NotificationTarget::AssetCacheUpdate});
}

} // namespace STS
