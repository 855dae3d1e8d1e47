#include "asset/AssetPipeline.hpp"
#include "asset/ColormapPreview.hpp"
#include "log/TaggedLogger.hpp"
#include "net/UrlFetcher.hpp"
#include "utils/FileUtils.hpp"

#include <algorithm>
#include <exception>
#include <latch>
#include <set>
#include <system_error>

namespace STS::Asset {

namespace {

auto readManifest(std::filesystem::path const& path) -> Expected<json> {
    auto text = Utils::readTextFile(path);
    if (!text)
        return std::unexpected(text.error());
    try {
        auto manifest = json::parse(*text);
        if (!manifest.is_object())
            return std::unexpected(Error{Error::Code::MalformedInput, "Manifest " + path.string() + " is not an object"});
        return manifest;
    } catch (json::parse_error const& e) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "Manifest " + path.string() + " is not valid JSON: " + e.what()});
    }
}

} // namespace

auto isValidAssetIdentifier(std::string const& identifier) -> bool {
    if (identifier.empty() || identifier == "." || identifier == "..")
        return false;
    return identifier.find_first_of(std::string{"/\\\0", 3}) == std::string::npos;
}

auto collectStringLeaves(json const& node) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::vector<json const*> stack{&node};
    while (!stack.empty()) {
        auto const* current = stack.back();
        stack.pop_back();
        if (current->is_string()) {
            out.push_back(current->get<std::string>());
        } else if (current->is_array() || current->is_object()) {
            std::vector<json const*> children;
            for (auto const& child : *current)
                children.push_back(&child);
            stack.insert(stack.end(), children.rbegin(), children.rend());
        }
    }
    return out;
}

AssetPipeline::AssetPipeline(AssetPipelineOptions options, std::shared_ptr<Net::UrlFetcher> fetcher)
    : opts(std::move(options)), fetcher(std::move(fetcher)), pool(opts.workerCount) {
    if (!this->opts.defaultSource.empty())
        this->knownSources.push_back(this->opts.defaultSource);
}

AssetPipeline::~AssetPipeline() {
    this->detach();
    this->pool.shutdown();
}

auto AssetPipeline::sources() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(this->sourcesMutex);
    return this->knownSources;
}

auto AssetPipeline::assetDirectory(std::string const& identifier) const -> std::filesystem::path {
    return this->opts.assetRoot / identifier;
}

auto AssetPipeline::fetchIfMissing(std::string const& url, std::filesystem::path const& path) -> Expected<void> {
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
        return {};
    if (!this->fetcher)
        return std::unexpected(Error{Error::Code::NotSupported, "No fetcher configured"});
    auto body = this->fetcher->fetch(url);
    if (!body)
        return std::unexpected(body.error());
    return Utils::writeTextFileAtomic(path, *body);
}

auto AssetPipeline::resolve(std::string const& identifier, std::optional<std::string> const& extraSource)
    -> FailedFiles {
    if (!isValidAssetIdentifier(identifier)) {
        sts_log("Refusing to resolve invalid asset identifier '" + identifier + "'", "Asset", "Error");
        return FailedFiles{this->opts.assetRoot / identifier};
    }

    std::vector<std::string> order;
    {
        std::lock_guard<std::mutex> lock(this->sourcesMutex);
        if (extraSource && !extraSource->empty()) {
            if (std::find(this->knownSources.begin(), this->knownSources.end(), *extraSource)
                == this->knownSources.end())
                this->knownSources.push_back(*extraSource);
            order.push_back(*extraSource);
        }
        for (auto const& source : this->knownSources) {
            if (std::find(order.begin(), order.end(), source) == order.end())
                order.push_back(source);
        }
    }

    if (order.empty()) {
        sts_log("No asset source configured for " + identifier, "Asset", "Error");
        return FailedFiles{this->assetDirectory(identifier) / this->opts.manifestName};
    }

    FailedFiles failed;
    for (auto const& source : order) {
        auto fromSource = this->resolveFromSource(identifier, source);
        failed.insert(failed.end(), fromSource.begin(), fromSource.end());
    }
    return failed;
}

auto AssetPipeline::resolveFromSource(std::string const& identifier, std::string const& source) -> FailedFiles {
    FailedFiles  failed;
    auto const   dir          = this->assetDirectory(identifier);
    auto const   manifestPath = dir / this->opts.manifestName;
    auto const   baseUrl      = Net::joinUrl(source, identifier) + "/";

    if (auto fetched = this->fetchIfMissing(baseUrl + this->opts.manifestName, manifestPath); !fetched) {
        sts_log("Manifest for " + identifier + " unavailable from " + source + ": " + describeError(fetched.error()),
                "Asset",
                "Error");
        failed.push_back(manifestPath);
        return failed;
    }
    auto manifest = readManifest(manifestPath);
    if (!manifest) {
        sts_log(describeError(manifest.error()), "Asset", "Error");
        failed.push_back(manifestPath);
        return failed;
    }

    std::vector<std::string> names;
    if (auto preview = manifest->find("preview"); preview != manifest->end() && preview->is_string())
        names.push_back(preview->get<std::string>());
    if (auto data = manifest->find("artifactData"); data != manifest->end()) {
        auto leaves = collectStringLeaves(*data);
        names.insert(names.end(), leaves.begin(), leaves.end());
    }

    std::set<std::string>    seen;
    std::vector<std::string> files;
    for (auto& name : names) {
        if (!seen.insert(name).second)
            continue;
        if (!Utils::isContainedRelativePath(name)) {
            sts_log("Skipping unsafe file name '" + name + "' in " + identifier, "Asset", "Error");
            failed.push_back(dir / name);
            continue;
        }
        files.push_back(std::move(name));
    }
    if (files.empty())
        return failed;

    std::mutex  failedMutex;
    std::latch  done(static_cast<std::ptrdiff_t>(files.size()));
    auto        recordFailure = [&](std::filesystem::path path) {
        std::lock_guard<std::mutex> lock(failedMutex);
        failed.push_back(std::move(path));
    };

    for (auto const& name : files) {
        auto target = dir / name;
        auto url    = baseUrl + name;
        auto job    = [this, &done, &recordFailure, target, url]() {
            try {
                auto fetched = this->fetchIfMissing(url, target);
                if (!fetched) {
                    sts_log("Download " + url + " failed: " + describeError(fetched.error()), "Asset", "Error");
                    recordFailure(target);
                }
            } catch (std::exception const& e) {
                sts_log("Download " + url + " threw: " + e.what(), "Asset", "Error");
                recordFailure(target);
            }
            done.count_down();
        };
        if (auto submitted = this->pool.submit(std::move(job)); !submitted) {
            recordFailure(target);
            done.count_down();
        }
    }
    done.wait();
    return failed;
}

auto AssetPipeline::saveLocal(json const& payload) -> Expected<SavedAsset> {
    auto manifestIt = payload.is_object() ? payload.find("artifactJson") : payload.end();
    auto contentsIt = payload.is_object() ? payload.find("artifactDataContents") : payload.end();
    if (manifestIt == payload.end() || !manifestIt->is_object() || contentsIt == payload.end()
        || !contentsIt->is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "Local asset needs artifactJson and artifactDataContents objects"});
    }
    for (auto const& [name, contents] : contentsIt->items()) {
        if (!contents.is_string() || !Utils::isContainedRelativePath(name)) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Invalid local asset file '" + name + "'"});
        }
    }

    auto const typeIt     = manifestIt->find("type");
    bool const isColormap = typeIt != manifestIt->end() && typeIt->is_string() && *typeIt == "colormap";
    if (isColormap && !contentsIt->contains(this->opts.colormapFile)) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "Colormap asset has no " + this->opts.colormapFile});
    }

    SavedAsset saved;
    saved.identifier = Utils::generateUuid();
    auto manifest    = *manifestIt;
    manifest["uuid"] = saved.identifier;

    auto const dir     = this->assetDirectory(saved.identifier);
    auto       discard = [&dir](Error error) -> Expected<SavedAsset> {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec)
            sts_log("Failed to remove partial asset " + dir.string() + ": " + ec.message(), "Asset", "Error");
        return std::unexpected(std::move(error));
    };

    if (auto written = Utils::writeTextFileAtomic(dir / this->opts.manifestName, manifest.dump()); !written)
        return discard(written.error());
    for (auto const& [name, contents] : contentsIt->items()) {
        if (auto written = Utils::writeTextFileAtomic(dir / name, contents.get<std::string>()); !written)
            return discard(written.error());
    }

    if (isColormap) {
        auto const& xml     = (*contentsIt)[this->opts.colormapFile].get_ref<std::string const&>();
        auto        preview = writeColormapPreview(xml,
                                            this->opts.previewWidth,
                                            this->opts.previewHeight,
                                            dir / this->opts.previewName);
        if (!preview)
            return discard(preview.error());
        saved.previewWritten = true;
    }

    {
        std::lock_guard<std::mutex> lock(this->cacheMutex);
        this->manifestCache[saved.identifier] = std::move(manifest);
    }
    sts_log("Saved local asset " + saved.identifier, "Asset", "INFO");
    return saved;
}

auto AssetPipeline::removeAsset(std::string const& identifier) -> Expected<void> {
    if (!isValidAssetIdentifier(identifier)) {
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid asset identifier '" + identifier + "'"});
    }
    {
        std::lock_guard<std::mutex> lock(this->cacheMutex);
        this->manifestCache.erase(identifier);
    }
    std::error_code ec;
    std::filesystem::remove_all(this->assetDirectory(identifier), ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoFailure,
                                     "Failed to remove asset " + identifier + ": " + ec.message()});
    }
    return {};
}

auto AssetPipeline::listAssets() -> json {
    std::lock_guard<std::mutex> lock(this->cacheMutex);

    std::set<std::string> present;
    std::error_code       ec;
    if (std::filesystem::is_directory(this->opts.assetRoot, ec)) {
        for (auto const& entry : std::filesystem::directory_iterator(this->opts.assetRoot, ec)) {
            if (!entry.is_directory(ec))
                continue;
            auto identifier = entry.path().filename().string();
            present.insert(identifier);
            if (this->manifestCache.contains(identifier))
                continue;
            auto manifest = readManifest(entry.path() / this->opts.manifestName);
            if (manifest)
                this->manifestCache.emplace(identifier, std::move(*manifest));
        }
    }
    std::erase_if(this->manifestCache, [&](auto const& item) { return !present.contains(item.first); });

    json out = json::object();
    for (auto const& [identifier, manifest] : this->manifestCache)
        out[identifier] = manifest;
    return out;
}

void AssetPipeline::attach(Notify::Notifier& notifier, StateLookup lookup) {
    this->detach();
    std::lock_guard<std::mutex> lock(this->attachMutex);
    this->attachedNotifier = &notifier;
    this->saveHandlerId    = notifier.registerHandler(
        Notify::InboundTopic::SaveLocalAsset,
        [this, lookup = std::move(lookup)](json const& message, Notify::SubscriberId const&) {
            this->handleSaveLocal(message, lookup);
        });
}

void AssetPipeline::detach() {
    std::lock_guard<std::mutex> lock(this->attachMutex);
    if (this->attachedNotifier != nullptr && this->saveHandlerId)
        this->attachedNotifier->unregisterHandler(Notify::InboundTopic::SaveLocalAsset, *this->saveHandlerId);
    this->attachedNotifier = nullptr;
    this->saveHandlerId.reset();
}

auto AssetPipeline::saveFromState(std::string const& identifier, StateLookup const& lookup) -> Expected<SavedAsset> {
    auto payload = lookup(StatePath{"localVisAssets", identifier});
    if (!payload)
        return std::unexpected(Error{Error::Code::NotFound, "No local asset " + identifier + " in state"});
    auto saved = this->saveLocal(*payload);
    if (!saved)
        return saved;
    if (!saved->previewWritten) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "No preview produced for local asset " + identifier});
    }
    return saved;
}

void AssetPipeline::handleSaveLocal(json const& message, StateLookup const& lookup) {
    auto identifierIt = message.find("identifier");
    if (identifierIt == message.end() || !identifierIt->is_string() || identifierIt->get_ref<std::string const&>().empty()) {
        sts_log("save-local-asset message without identifier", "Asset", "Error");
        return;
    }
    auto const identifier = identifierIt->get<std::string>();
    auto       saved      = this->saveFromState(identifier, lookup);
    if (!saved) {
        sts_log("Unable to save local asset " + identifier + ": " + describeError(saved.error()), "Asset", "Error");
        return;
    }

    Notify::Notifier* notifier = nullptr;
    {
        std::lock_guard<std::mutex> lock(this->attachMutex);
        notifier = this->attachedNotifier;
    }
    if (notifier != nullptr)
        notifier->broadcast(Notify::Notification{Notify::NotificationTarget::AssetCacheUpdate});
}

} // namespace STS::Asset
