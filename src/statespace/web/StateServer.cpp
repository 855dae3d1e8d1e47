#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"

#include <statespace/web/StateServer.hpp>
#include <statespace/web/routing/AssetController.hpp>
#include <statespace/web/routing/HttpHelpers.hpp>
#include <statespace/web/routing/SchemaController.hpp>
#include <statespace/web/routing/StateController.hpp>
#include <statespace/web/streaming/SubscriberStream.hpp>

#include "asset/AssetPipeline.hpp"
#include "net/UrlFetcher.hpp"
#include "notify/Notifier.hpp"
#include "schema/SchemaRegistry.hpp"
#include "state/StateStore.hpp"
#include "thumbnail/ThumbnailStore.hpp"
#include "utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace STS::Web {

static std::atomic<bool> g_should_stop{false};

namespace {

auto load_message_schema(std::filesystem::path const&              file,
                         std::function<void(std::string_view)> const& log_info)
    -> std::optional<nlohmann::json> {
    auto text = Utils::readTextFile(file);
    if (!text) {
        log_info(std::string{"[statespace] No message schema at "} + file.string()
                 + "; messages are not validated");
        return std::nullopt;
    }
    auto schema = nlohmann::json::parse(*text, nullptr, false);
    if (schema.is_discarded()) {
        log_info(std::string{"[statespace] Ignoring unparsable message schema "} + file.string());
        return std::nullopt;
    }
    return schema;
}

auto outgoing_schema_url(std::optional<nlohmann::json> const& schema) -> std::string {
    if (schema && schema->is_object()) {
        if (auto it = schema->find("$id"); it != schema->end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "ws-outgoing.json";
}

} // namespace

auto MakeStateServerLayout(StateServerOptions const& options) -> StateServerLayout {
    std::filesystem::path data_root{options.data_root};
    std::filesystem::path schema_dir{options.schema_dir};
    return StateServerLayout{
        .asset_root           = data_root / "visassets",
        .backup_file          = data_root / "state-backups.json",
        .thumbnail_dir        = data_root / "thumbnails",
        .state_schema_dir     = schema_dir / "state",
        .incoming_schema_file = schema_dir / "messages" / "ws-incoming.json",
        .outgoing_schema_file = schema_dir / "messages" / "ws-outgoing.json",
    };
}

void RequestStateServerStop() {
    g_should_stop.store(true);
}

void ResetStateServerStopFlag() {
    g_should_stop.store(false);
}

int RunStateServerWithStopFlag(StateServerOptions const&           options,
                               std::atomic<bool>&                  should_stop,
                               StateServerLogHooks const&          log_hooks,
                               std::function<void(Expected<void>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    auto fail_startup = [&](std::string const& message) {
        log_error("[statespace] " + message);
        report_listen_status(std::unexpected(Error{Error::Code::InvalidError, message}));
        return EXIT_FAILURE;
    };

    auto layout  = MakeStateServerLayout(options);
    auto fetcher = std::make_shared<Net::HttpUrlFetcher>();

    Schema::SchemaRegistry registry{
        Schema::SchemaRegistry::Options{
            .url                = options.schema_url,
            .backupDirectory    = layout.state_schema_dir,
            .publishedDirectory = options.schema_dir,
        },
        fetcher.get()};
    auto schema = registry.load();
    if (!schema) {
        return fail_startup("Unable to load state schema: " + describeError(schema.error()));
    }

    auto incoming_schema = load_message_schema(layout.incoming_schema_file, log_info);
    auto outgoing_schema = load_message_schema(layout.outgoing_schema_file, log_info);
    Notify::Notifier notifier{Notify::Notifier::Options{
        .schemaUrl      = outgoing_schema_url(outgoing_schema),
        .incomingSchema = std::move(incoming_schema),
        .outgoingSchema = std::move(outgoing_schema),
    }};

    std::error_code ec;
    std::filesystem::create_directories(layout.asset_root, ec);
    if (ec) {
        return fail_startup("Unable to create " + layout.asset_root.string() + ": " + ec.message());
    }
    std::filesystem::create_directories(layout.thumbnail_dir, ec);
    if (ec) {
        return fail_startup("Unable to create " + layout.thumbnail_dir.string() + ": " + ec.message());
    }

    Asset::AssetPipeline assets{Asset::AssetPipelineOptions{
                                    .assetRoot     = layout.asset_root,
                                    .defaultSource = options.asset_library,
                                    .workerCount   = static_cast<std::size_t>(options.download_workers),
                                },
                                fetcher};

    auto store = StateStore::Create(
        StateStoreOptions{
            .schema          = std::move(*schema),
            .defaultDocument = std::nullopt,
            .backupFile      = layout.backup_file,
            .backupRetention = std::chrono::seconds{options.backup_retention_seconds},
            .historyLimit    = static_cast<std::size_t>(options.history_limit),
            .downloadAssets  = options.download_assets,
        },
        notifier,
        &assets);
    if (!store) {
        return fail_startup("Unable to initialize state: " + describeError(store.error()));
    }
    StateStore& state = **store;

    assets.attach(notifier, [&state](StatePath const& path) { return state.get(path); });
    Thumbnail::ThumbnailStore thumbnails{layout.thumbnail_dir};
    thumbnails.attach(notifier);

    HttpRequestContext http_context{
        .store    = state,
        .notifier = notifier,
        .assets   = assets,
        .schemas  = registry,
        .options  = options,
    };

    httplib::Server server;
    server.set_payload_max_length(kMaxRequestBodyBytes);

    server.Get("/", [](httplib::Request const&, httplib::Response& res) {
        res.set_content("StateSpace server\n\nGET /api/state/<path> to read the shared state, GET /api/events to "
                        "subscribe to changes.\n",
                        "text/plain; charset=utf-8");
    });

    server.Get("/healthz", [](httplib::Request const&, httplib::Response& res) {
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    auto state_controller = StateController::Create(http_context);
    state_controller->register_routes(server);

    auto asset_controller = AssetController::Create(http_context);
    asset_controller->register_routes(server);

    auto schema_controller = SchemaController::Create(http_context);
    schema_controller->register_routes(server);

    auto subscriber_stream = SubscriberStream::Create(http_context, should_stop);
    subscriber_stream->register_routes(server);

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
        if (!server.listen(options.host.c_str(), options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(std::string{"[statespace] Failed to bind "} + options.host + ":"
                          + std::to_string(options.port));
            }
        }
    });

    log_info(std::string{"[statespace] Listening on http://"} + options.host + ":"
             + std::to_string(options.port));

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status({});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::InvalidError, "failed to bind state server listener"}));
        } else if (should_stop.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::InvalidError, "state server stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    thumbnails.detach();
    assets.detach();

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunStateServer(StateServerOptions const& options) {
    return RunStateServerWithStopFlag(options, g_should_stop, {}, {});
}

} // namespace STS::Web
