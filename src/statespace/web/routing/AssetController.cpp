#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"

#include <statespace/web/routing/AssetController.hpp>
#include <statespace/web/routing/HttpHelpers.hpp>

#include "asset/AssetPipeline.hpp"
#include "log/TaggedLogger.hpp"
#include "notify/Notifier.hpp"
#include "state/StateStore.hpp"

#include <optional>
#include <string>

namespace STS::Web {

namespace {

auto read_identifier(httplib::Request const& req, httplib::Response& res) -> std::optional<std::string> {
    if (req.matches.size() < 2) {
        respond_bad_request(res, "invalid asset route");
        return std::nullopt;
    }
    std::string identifier = req.matches[1];
    if (!Asset::isValidAssetIdentifier(identifier)) {
        respond_bad_request(res, "invalid asset identifier");
        return std::nullopt;
    }
    return identifier;
}

} // namespace

auto AssetController::Create(HttpRequestContext& ctx) -> std::unique_ptr<AssetController> {
    return std::unique_ptr<AssetController>(new AssetController(ctx));
}

AssetController::AssetController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

AssetController::~AssetController() = default;

void AssetController::register_routes(httplib::Server& server) {
    server.Get("/api/visassets", [this](httplib::Request const& req, httplib::Response& res) {
        handle_list(req, res);
    });
    server.Post(R"(/api/download-visasset/([A-Za-z0-9_\-\.]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_download(req, res);
    });
    server.Delete(R"(/api/remove-visasset/([A-Za-z0-9_\-\.]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_remove(req, res);
    });
    server.Post(R"(/api/save-local-visasset/([A-Za-z0-9_\-\.]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_save_local(req, res);
    });
}

void AssetController::handle_list(httplib::Request const&, httplib::Response& res) {
    write_json_response(res, ctx_.assets.listAssets(), 200, true);
}

void AssetController::handle_download(httplib::Request const& req, httplib::Response& res) {
    auto identifier = read_identifier(req, res);
    if (!identifier) {
        return;
    }

    // A missing or unreadable body falls back to the default library.
    std::optional<std::string> host_path;
    if (req.body.size() <= kMaxRequestBodyBytes && !req.body.empty()) {
        auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_object()) {
            if (auto it = body.find("hostPath"); it != body.end() && it->is_string()) {
                host_path = it->get<std::string>();
            }
        }
    }

    auto failed = ctx_.assets.resolve(*identifier, host_path);
    if (!failed.empty()) {
        std::string listing;
        for (auto const& path : failed) {
            if (!listing.empty()) {
                listing.append(", ");
            }
            listing.append(path.string());
        }
        sts_log("Download of " + *identifier + " incomplete: " + listing, "AssetController", "Error");
        respond_server_error(res, "Failed to download files: [" + listing + "]");
        return;
    }

    ctx_.notifier.broadcast(Notify::Notification{Notify::NotificationTarget::AssetCacheUpdate});
    write_text_response(res, 200, "Downloaded files");
}

void AssetController::handle_remove(httplib::Request const& req, httplib::Response& res) {
    auto identifier = read_identifier(req, res);
    if (!identifier) {
        return;
    }
    if (auto removed = ctx_.assets.removeAsset(*identifier); !removed) {
        respond_error(res, removed.error());
        return;
    }
    ctx_.notifier.broadcast(Notify::Notification{Notify::NotificationTarget::AssetCacheUpdate});
    respond_ok(res);
}

void AssetController::handle_save_local(httplib::Request const& req, httplib::Response& res) {
    auto identifier = read_identifier(req, res);
    if (!identifier) {
        return;
    }
    auto saved = ctx_.assets.saveFromState(*identifier, [this](StatePath const& path) {
        return ctx_.store.get(path);
    });
    if (!saved) {
        sts_log("save-local-visasset " + *identifier + ": " + describeError(saved.error()), "AssetController", "Error");
        respond_bad_request(res, "Unable to save Local VisAsset");
        return;
    }
    ctx_.notifier.broadcast(Notify::Notification{Notify::NotificationTarget::AssetCacheUpdate});
    write_json_response(res, nlohmann::json{{"identifier", saved->identifier}}, 200, true);
}

} // namespace STS::Web
