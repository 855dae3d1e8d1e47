#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"

#include <statespace/web/routing/HttpHelpers.hpp>
#include <statespace/web/routing/StateController.hpp>

#include "core/StatePath.hpp"
#include "log/TaggedLogger.hpp"
#include "state/StateStore.hpp"

#include <string>

namespace STS::Web {

namespace {

constexpr std::string_view kStatePrefix      = "/api/state";
constexpr std::string_view kRemovePathPrefix = "/api/remove-path";

} // namespace

auto StateController::Create(HttpRequestContext& ctx) -> std::unique_ptr<StateController> {
    return std::unique_ptr<StateController>(new StateController(ctx));
}

StateController::StateController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

StateController::~StateController() = default;

void StateController::register_routes(httplib::Server& server) {
    server.Get(R"(/api/state(/.*)?)", [this](httplib::Request const& req, httplib::Response& res) {
        handle_get_state(req, res);
    });
    server.Put(R"(/api/state(/.*)?)", [this](httplib::Request const& req, httplib::Response& res) {
        handle_put_state(req, res);
    });
    server.Delete(R"(/api/remove-path(/.*)?)", [this](httplib::Request const& req, httplib::Response& res) {
        handle_remove_path(req, res);
    });
    server.Delete(R"(/api/remove/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_remove_key(req, res);
    });
    server.Post("/api/undo", [this](httplib::Request const& req, httplib::Response& res) {
        handle_undo(req, res);
    });
    server.Post("/api/redo", [this](httplib::Request const& req, httplib::Response& res) {
        handle_redo(req, res);
    });
}

void StateController::handle_get_state(httplib::Request const& req, httplib::Response& res) {
    auto path = parseRequestPath(req.path, kStatePrefix);
    if (!path) {
        respond_error(res, path.error());
        return;
    }
    auto value = ctx_.store.get(*path);
    write_json_response(res, nlohmann::json{{"state", value.value_or(nlohmann::json(nullptr))}}, 200, true);
}

void StateController::handle_put_state(httplib::Request const& req, httplib::Response& res) {
    auto path = parseRequestPath(req.path, kStatePrefix);
    if (!path) {
        respond_error(res, path.error());
        return;
    }
    bool ok   = true;
    auto body = parse_json_body(req, res, ok);
    if (!ok) {
        return;
    }
    if (!body) {
        respond_bad_request(res, "Request body must not be empty");
        return;
    }
    if (auto result = ctx_.store.set(*path, std::move(*body)); !result) {
        sts_log("PUT " + req.path + " rejected: " + describeError(result.error()), "StateController", "Error");
        respond_error(res, result.error());
        return;
    }
    respond_ok(res);
}

void StateController::handle_remove_path(httplib::Request const& req, httplib::Response& res) {
    auto path = parseRequestPath(req.path, kRemovePathPrefix);
    if (!path) {
        respond_error(res, path.error());
        return;
    }
    if (auto result = ctx_.store.remove(*path); !result) {
        respond_error(res, result.error());
        return;
    }
    write_text_response(res, 200, "OK");
}

void StateController::handle_remove_key(httplib::Request const& req, httplib::Response& res) {
    if (req.matches.size() < 2) {
        respond_bad_request(res, "invalid remove route");
        return;
    }
    std::string key = req.matches[1];
    if (auto result = ctx_.store.removeAll(key); !result) {
        respond_error(res, result.error());
        return;
    }
    write_text_response(res, 200, "OK");
}

void StateController::handle_undo(httplib::Request const&, httplib::Response& res) {
    if (auto result = ctx_.store.undo(); !result) {
        respond_error(res, result.error());
        return;
    }
    respond_ok(res);
}

void StateController::handle_redo(httplib::Request const&, httplib::Response& res) {
    if (auto result = ctx_.store.redo(); !result) {
        respond_error(res, result.error());
        return;
    }
    respond_ok(res);
}

} // namespace STS::Web
