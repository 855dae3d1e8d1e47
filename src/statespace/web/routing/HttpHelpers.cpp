#include <statespace/web/routing/HttpHelpers.hpp>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"

namespace STS::Web {

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void write_text_response(httplib::Response& res, int status, std::string_view message) {
    res.status = status;
    res.set_content(std::string{message}, "text/plain; charset=utf-8");
}

void respond_ok(httplib::Response& res) {
    res.status = 200;
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_text_response(res, 400, message);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_text_response(res, 500, message);
}

void respond_payload_too_large(httplib::Response& res) {
    write_text_response(res, 413, "Request body exceeds 16 MiB limit");
}

auto status_for_error(Error const& error) -> int {
    switch (error.code) {
    case Error::Code::IoFailure:
    case Error::Code::UnknownError:
        return 500;
    case Error::Code::AssetFetch:
        return 502;
    default:
        return 400;
    }
}

void respond_error(httplib::Response& res, Error const& error) {
    write_text_response(res, status_for_error(error), errorMessage(error));
}

auto parse_json_body(httplib::Request const& req, httplib::Response& res, bool& ok)
    -> std::optional<nlohmann::json> {
    ok = true;
    if (req.body.size() > kMaxRequestBodyBytes) {
        respond_payload_too_large(res);
        ok = false;
        return std::nullopt;
    }
    if (req.body.empty()) {
        return std::nullopt;
    }
    auto payload = nlohmann::json::parse(req.body, nullptr, false);
    if (payload.is_discarded()) {
        respond_bad_request(res, "Request body must be JSON");
        ok = false;
        return std::nullopt;
    }
    return payload;
}

} // namespace STS::Web
