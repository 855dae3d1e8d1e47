#include "asset/AssetPipeline.hpp"

#include "../StateSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <string>

using namespace STS;
using namespace STS::Asset;
using STS::Test::FakeFetcher;
using STS::Test::RecordingChannel;
using STS::Test::TempDirectory;

namespace {

constexpr char const* Library = "https://library.example.org/assets";

constexpr char const* GreyXml = R"(<ColorMaps><ColorMap name="Grey">
<Point x="0" r="0" g="0" b="0"/><Point x="1" r="1" g="1" b="1"/>
</ColorMap></ColorMaps>)";

void serveAsset(FakeFetcher& fetcher, std::string const& base, std::string const& identifier) {
    auto const prefix = base + "/" + identifier + "/";
    fetcher.serve(prefix + "artifact.json", R"({
        "uuid": ")" + identifier + R"(",
        "type": "colormap",
        "preview": "preview.png",
        "artifactData": {"colormap": "colormap.xml", "extra": ["notes.txt"]}
    })");
    fetcher.serve(prefix + "preview.png", "png-bytes");
    fetcher.serve(prefix + "colormap.xml", GreyXml);
    fetcher.serve(prefix + "notes.txt", "hello");
}

auto makePipeline(TempDirectory const& tmp, std::shared_ptr<FakeFetcher> fetcher, std::string source = Library) {
    return std::make_unique<AssetPipeline>(
        AssetPipelineOptions{.assetRoot = tmp / "visassets", .defaultSource = std::move(source), .workerCount = 3},
        std::move(fetcher));
}

auto colormapPayload() -> json {
    return json{
        {"artifactJson", {{"type", "colormap"}, {"name", "Grey"}}},
        {"artifactDataContents", {{"colormap.xml", GreyXml}}},
    };
}

} // namespace

TEST_SUITE("AssetPipeline") {

TEST_CASE("identifier validation") {
    CHECK(isValidAssetIdentifier("4b0f0c7e-aaaa"));
    CHECK_FALSE(isValidAssetIdentifier(""));
    CHECK_FALSE(isValidAssetIdentifier(".."));
    CHECK_FALSE(isValidAssetIdentifier("a/b"));
}

TEST_CASE("string leaves are collected in document order") {
    auto leaves = collectStringLeaves(json::parse(R"({"a": "1.txt", "b": ["2.txt", {"c": "3.txt"}], "d": 4})"));
    CHECK(leaves == std::vector<std::string>{"1.txt", "2.txt", "3.txt"});
}

TEST_CASE("resolve downloads manifest, preview and data files") {
    TempDirectory tmp;
    auto          fetcher = std::make_shared<FakeFetcher>();
    serveAsset(*fetcher, Library, "grey");
    auto pipeline = makePipeline(tmp, fetcher);

    auto failed = pipeline->resolve("grey");
    CHECK(failed.empty());

    auto const dir = pipeline->assetDirectory("grey");
    CHECK(std::filesystem::exists(dir / "artifact.json"));
    CHECK(Utils::readTextFile(dir / "preview.png").value_or("") == "png-bytes");
    CHECK(Utils::readTextFile(dir / "notes.txt").value_or("") == "hello");
    CHECK(std::filesystem::exists(dir / "colormap.xml"));
}

TEST_CASE("files already on disk are not fetched again") {
    TempDirectory tmp;
    auto          fetcher = std::make_shared<FakeFetcher>();
    serveAsset(*fetcher, Library, "grey");
    auto pipeline = makePipeline(tmp, fetcher);

    auto const dir = pipeline->assetDirectory("grey");
    REQUIRE(Utils::writeTextFileAtomic(dir / "notes.txt", "local copy").has_value());

    CHECK(pipeline->resolve("grey").empty());
    CHECK(fetcher->requestCount(std::string{Library} + "/grey/notes.txt") == 0);
    CHECK(Utils::readTextFile(dir / "notes.txt").value_or("") == "local copy");

    auto const before = fetcher->requests().size();
    CHECK(pipeline->resolve("grey").empty());
    CHECK(fetcher->requests().size() == before);
}

TEST_CASE("missing files are reported without stopping siblings") {
    TempDirectory tmp;
    auto          fetcher = std::make_shared<FakeFetcher>();
    fetcher->serve(std::string{Library} + "/partial/artifact.json",
                   R"({"artifactData": {"a": "present.txt", "b": "absent.txt"}})");
    fetcher->serve(std::string{Library} + "/partial/present.txt", "ok");
    auto pipeline = makePipeline(tmp, fetcher);

    auto failed = pipeline->resolve("partial");
    REQUIRE(failed.size() == 1);
    CHECK(failed.front().filename() == "absent.txt");
    CHECK(std::filesystem::exists(pipeline->assetDirectory("partial") / "present.txt"));
}

TEST_CASE("unreachable manifest fails the asset") {
    TempDirectory tmp;
    auto          fetcher  = std::make_shared<FakeFetcher>();
    auto          pipeline = makePipeline(tmp, fetcher);

    auto failed = pipeline->resolve("nowhere");
    REQUIRE(failed.size() == 1);
    CHECK(failed.front().filename() == "artifact.json");
}

TEST_CASE("resolve without any source reports the manifest as missing") {
    TempDirectory tmp;
    auto          fetcher  = std::make_shared<FakeFetcher>();
    auto          pipeline = makePipeline(tmp, fetcher, "");
    CHECK(pipeline->sources().empty());

    auto failed = pipeline->resolve("abc123");
    REQUIRE(failed.size() == 1);
    CHECK(failed.front() == pipeline->assetDirectory("abc123") / "artifact.json");
    CHECK(fetcher->requests().empty());
    CHECK_FALSE(std::filesystem::exists(pipeline->assetDirectory("abc123")));
}

TEST_CASE("concurrent downloads are capped by the worker count") {
    TempDirectory tmp;
    auto          fetcher = std::make_shared<FakeFetcher>();
    json          data    = json::object();
    for (int i = 0; i < 24; ++i) {
        auto name = "part-" + std::to_string(i) + ".bin";
        data[name] = name;
        fetcher->serve(std::string{Library} + "/bulk/" + name, "x");
    }
    fetcher->serve(std::string{Library} + "/bulk/artifact.json", json{{"artifactData", data}}.dump());
    fetcher->setLatency(std::chrono::milliseconds{15});

    AssetPipeline pipeline{AssetPipelineOptions{.assetRoot = tmp / "visassets", .defaultSource = Library}, fetcher};
    CHECK(pipeline.resolve("bulk").empty());
    CHECK(fetcher->requests().size() == 25);
    CHECK(fetcher->peakInFlight() >= 1);
    CHECK(fetcher->peakInFlight() <= 8);
}

TEST_CASE("invalid identifiers are refused without fetching") {
    TempDirectory tmp;
    auto          fetcher  = std::make_shared<FakeFetcher>();
    auto          pipeline = makePipeline(tmp, fetcher);

    auto failed = pipeline->resolve("../escape");
    CHECK(failed.size() == 1);
    CHECK(fetcher->requests().empty());
}

TEST_CASE("extra source is tried first and remembered") {
    TempDirectory tmp;
    auto          fetcher = std::make_shared<FakeFetcher>();
    auto const    mirror  = std::string{"http://localhost:9000/mirror"};
    serveAsset(*fetcher, mirror, "grey");
    auto pipeline = makePipeline(tmp, fetcher);

    CHECK(pipeline->resolve("grey", mirror).empty());
    auto requests = fetcher->requests();
    REQUIRE_FALSE(requests.empty());
    CHECK(requests.front() == mirror + "/grey/artifact.json");

    auto sources = pipeline->sources();
    CHECK(sources.size() == 2);
    CHECK(std::find(sources.begin(), sources.end(), mirror) != sources.end());
}

TEST_CASE("saveLocal writes a colormap with its preview") {
    TempDirectory tmp;
    auto          pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());

    auto saved = pipeline->saveLocal(colormapPayload());
    REQUIRE(saved.has_value());
    CHECK(saved->identifier.size() == 36);
    CHECK(saved->previewWritten);

    auto const dir = pipeline->assetDirectory(saved->identifier);
    CHECK(std::filesystem::exists(dir / "colormap.xml"));
    CHECK(std::filesystem::exists(dir / "thumbnail.png"));

    auto manifest = json::parse(Utils::readTextFile(dir / "artifact.json").value_or("{}"));
    CHECK(manifest["uuid"] == saved->identifier);
    CHECK(manifest["name"] == "Grey");
}

TEST_CASE("saveLocal of a non-colormap asset writes no preview") {
    TempDirectory tmp;
    auto          pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());

    auto saved = pipeline->saveLocal(json{
        {"artifactJson", {{"type", "glyph"}}},
        {"artifactDataContents", {{"glyph.obj", "v 0 0 0"}}},
    });
    REQUIRE(saved.has_value());
    CHECK_FALSE(saved->previewWritten);
    CHECK_FALSE(std::filesystem::exists(pipeline->assetDirectory(saved->identifier) / "thumbnail.png"));
}

TEST_CASE("saveLocal rejects malformed payloads") {
    TempDirectory tmp;
    auto          pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());

    auto noContents = pipeline->saveLocal(json{{"artifactJson", json::object()}});
    REQUIRE_FALSE(noContents.has_value());
    CHECK(noContents.error().code == Error::Code::MalformedInput);

    auto escaping = pipeline->saveLocal(json{
        {"artifactJson", json::object()},
        {"artifactDataContents", {{"../outside.txt", "x"}}},
    });
    REQUIRE_FALSE(escaping.has_value());

    auto colormapWithoutXml = pipeline->saveLocal(json{
        {"artifactJson", {{"type", "colormap"}}},
        {"artifactDataContents", {{"other.txt", "x"}}},
    });
    REQUIRE_FALSE(colormapWithoutXml.has_value());
    CHECK(colormapWithoutXml.error().code == Error::Code::MalformedInput);
}

TEST_CASE("a colormap whose preview cannot be rendered leaves nothing behind") {
    TempDirectory tmp;
    auto          pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());

    auto saved = pipeline->saveLocal(json{
        {"artifactJson", {{"type", "colormap"}}},
        {"artifactDataContents", {{"colormap.xml", "<ColorMaps><ColorMap name=\"Empty\"/></ColorMaps>"}}},
    });
    REQUIRE_FALSE(saved.has_value());
    CHECK(saved.error().code == Error::Code::MalformedInput);

    auto const root = tmp / "visassets";
    CHECK((!std::filesystem::exists(root) || std::filesystem::is_empty(root)));
    CHECK(pipeline->listAssets().empty());
}

TEST_CASE("listAssets and removeAsset track the directory") {
    TempDirectory tmp;
    auto          pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());

    auto saved = pipeline->saveLocal(colormapPayload());
    REQUIRE(saved.has_value());

    auto listing = pipeline->listAssets();
    REQUIRE(listing.contains(saved->identifier));
    CHECK(listing[saved->identifier]["type"] == "colormap");

    REQUIRE(pipeline->removeAsset(saved->identifier).has_value());
    CHECK_FALSE(std::filesystem::exists(pipeline->assetDirectory(saved->identifier)));
    CHECK_FALSE(pipeline->listAssets().contains(saved->identifier));

    CHECK(pipeline->removeAsset("never-existed").has_value());
    auto invalid = pipeline->removeAsset("..");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code == Error::Code::InvalidPath);
}

TEST_CASE("saveFromState requires a draft and a rendered preview") {
    TempDirectory tmp;
    auto          pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());
    auto          lookup   = [](StatePath const& path) -> std::optional<json> {
        if (path == StatePath{"localVisAssets", "cmap"})
            return colormapPayload();
        if (path == StatePath{"localVisAssets", "glyph"})
            return json{{"artifactJson", {{"type", "glyph"}}}, {"artifactDataContents", {{"glyph.obj", "v 0 0 0"}}}};
        return std::nullopt;
    };

    auto saved = pipeline->saveFromState("cmap", lookup);
    REQUIRE(saved.has_value());
    CHECK(saved->previewWritten);

    auto missing = pipeline->saveFromState("absent", lookup);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);

    auto noPreview = pipeline->saveFromState("glyph", lookup);
    REQUIRE_FALSE(noPreview.has_value());
    CHECK(noPreview.error().code == Error::Code::MalformedInput);
}

TEST_CASE("save-local-asset without a preview announces nothing") {
    TempDirectory    tmp;
    auto             pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());
    Notify::Notifier notifier;
    auto             channel = std::make_shared<RecordingChannel>();
    notifier.subscribe(channel);
    pipeline->attach(notifier, [](StatePath const&) -> std::optional<json> {
        return json{{"artifactJson", {{"type", "glyph"}}}, {"artifactDataContents", {{"glyph.obj", "v 0 0 0"}}}};
    });

    auto handled = notifier.dispatchInbound(json{{"target", "save-local-asset"}, {"identifier", "g"}}, "ui");
    REQUIRE(handled.has_value());
    CHECK(channel->payloads().empty());
}

TEST_CASE("save-local-asset messages save from state and announce the cache update") {
    TempDirectory    tmp;
    auto             pipeline = makePipeline(tmp, std::make_shared<FakeFetcher>());
    Notify::Notifier notifier;
    auto             channel = std::make_shared<RecordingChannel>();
    notifier.subscribe(channel);

    std::vector<StatePath> lookups;
    pipeline->attach(notifier, [&](StatePath const& path) -> std::optional<json> {
        lookups.push_back(path);
        if (path == StatePath{"localVisAssets", "draft-1"})
            return colormapPayload();
        return std::nullopt;
    });
    CHECK(notifier.handlerCount(Notify::InboundTopic::SaveLocalAsset) == 1);

    auto handled = notifier.dispatchInbound(json{{"target", "save-local-asset"}, {"identifier", "draft-1"}}, "ui");
    REQUIRE(handled.has_value());
    CHECK(*handled == 1);
    REQUIRE(lookups.size() == 1);
    CHECK(channel->targets() == std::vector<std::string>{"asset-cache-update"});
    CHECK(pipeline->listAssets().size() == 1);

    CHECK(notifier.dispatchInbound(json{{"target", "save-local-asset"}, {"identifier", "unknown"}}, "ui").has_value());
    CHECK(channel->payloads().size() == 1);

    pipeline->detach();
    CHECK(notifier.handlerCount(Notify::InboundTopic::SaveLocalAsset) == 0);
}

} // TEST_SUITE
