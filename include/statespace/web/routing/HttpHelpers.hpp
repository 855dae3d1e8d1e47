#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace STS {
class StateStore;
}
namespace STS::Notify {
class Notifier;
}
namespace STS::Asset {
class AssetPipeline;
}
namespace STS::Schema {
class SchemaRegistry;
}

namespace STS::Web {

struct StateServerOptions;

inline constexpr std::size_t kMaxRequestBodyBytes = 16 * 1024 * 1024;

struct HttpRequestContext {
    StateStore&               store;
    Notify::Notifier&         notifier;
    Asset::AssetPipeline&     assets;
    Schema::SchemaRegistry&   schemas;
    StateServerOptions const& options;
};

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store = false);

void write_text_response(httplib::Response& res, int status, std::string_view message);

void respond_ok(httplib::Response& res);
void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res);

// HTTP status for an error returned by the state or asset layers.
auto status_for_error(Error const& error) -> int;

void respond_error(httplib::Response& res, Error const& error);

// nullopt when the body is empty. A body that is not JSON is reported on `res`.
auto parse_json_body(httplib::Request const& req, httplib::Response& res, bool& ok)
    -> std::optional<nlohmann::json>;

} // namespace STS::Web
