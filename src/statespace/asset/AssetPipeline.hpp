#pragma once
#include "asset/WorkerPool.hpp"
#include "core/Error.hpp"
#include "core/StatePath.hpp"
#include "notify/Notifier.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace STS::Net {
class UrlFetcher;
}

namespace STS::Asset {

using json        = nlohmann::json;
using FailedFiles = std::vector<std::filesystem::path>;

/**
 * Materializes referenced assets on local disk. StateStore depends on this
 * interface only, so tests can observe resolution without a network.
 */
class AssetResolver {
public:
    virtual ~AssetResolver() = default;

    // Returns the files that could not be materialized; empty means resolved.
    virtual auto resolve(std::string const& identifier, std::optional<std::string> const& extraSource = std::nullopt)
        -> FailedFiles = 0;
};

struct AssetPipelineOptions {
    std::filesystem::path assetRoot;
    // Base URL of the default asset library; the identifier is appended to it.
    std::string           defaultSource;
    std::string           manifestName  = "artifact.json";
    std::size_t           workerCount   = 8;
    int                   previewWidth  = 200;
    int                   previewHeight = 30;
    std::string           previewName   = "thumbnail.png";
    std::string           colormapFile  = "colormap.xml";
};

struct SavedAsset {
    std::string identifier;
    bool        previewWritten = false;
};

// Looks up a value in the committed state; used to find locally defined assets.
using StateLookup = std::function<std::optional<json>(StatePath const&)>;

/**
 * Directory layout: <assetRoot>/<identifier>/{artifact.json, preview, data files}.
 *
 * resolve() walks every known source (a supplied extra source first, then the
 * remembered ones), fetches the manifest, then fetches the preview and every
 * string leaf of the manifest's "artifactData" subtree on the worker pool.
 * Files already on disk are not fetched again. Failures are collected per
 * file and never abort sibling downloads.
 */
class AssetPipeline final : public AssetResolver {
public:
    AssetPipeline(AssetPipelineOptions options, std::shared_ptr<Net::UrlFetcher> fetcher);
    ~AssetPipeline() override;

    AssetPipeline(AssetPipeline const&)            = delete;
    AssetPipeline& operator=(AssetPipeline const&) = delete;

    auto resolve(std::string const& identifier, std::optional<std::string> const& extraSource = std::nullopt)
        -> FailedFiles override;

    // payload: {"artifactJson": {...}, "artifactDataContents": {"name": "text", ...}}
    auto saveLocal(json const& payload) -> Expected<SavedAsset>;

    // Saves the draft stored at localVisAssets/<identifier>. An asset for
    // which no preview could be produced counts as not saved.
    auto saveFromState(std::string const& identifier, StateLookup const& lookup) -> Expected<SavedAsset>;

    // Succeeds when the asset is gone afterwards, including when it never existed.
    auto removeAsset(std::string const& identifier) -> Expected<void>;

    // Manifests of every locally present asset keyed by identifier.
    [[nodiscard]] auto listAssets() -> json;

    [[nodiscard]] auto sources() const -> std::vector<std::string>;
    [[nodiscard]] auto assetDirectory(std::string const& identifier) const -> std::filesystem::path;
    [[nodiscard]] auto options() const -> AssetPipelineOptions const& { return this->opts; }

    // Registers the save-local-asset handler. Replaces any earlier attachment.
    void attach(Notify::Notifier& notifier, StateLookup lookup);
    void detach();

private:
    AssetPipelineOptions             opts;
    std::shared_ptr<Net::UrlFetcher> fetcher;
    WorkerPool                       pool;

    mutable std::mutex       sourcesMutex;
    std::vector<std::string> knownSources;

    std::mutex                  cacheMutex;
    std::map<std::string, json> manifestCache;

    std::mutex                         attachMutex;
    Notify::Notifier*                  attachedNotifier = nullptr;
    std::optional<Notify::HandlerId>   saveHandlerId;

    auto fetchIfMissing(std::string const& url, std::filesystem::path const& path) -> Expected<void>;
    auto resolveFromSource(std::string const& identifier, std::string const& source) -> FailedFiles;
    void handleSaveLocal(json const& message, StateLookup const& lookup);
};

// Non-empty, a single path component, and not "." or "..".
[[nodiscard]] auto isValidAssetIdentifier(std::string const& identifier) -> bool;

// Every string leaf of `node`, depth-first, in document order.
[[nodiscard]] auto collectStringLeaves(json const& node) -> std::vector<std::string>;

} // namespace STS::Asset
