#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"

#include <statespace/web/routing/HttpHelpers.hpp>
#include <statespace/web/routing/SchemaController.hpp>

#include "schema/SchemaRegistry.hpp"

#include <string>

namespace STS::Web {

auto SchemaController::Create(HttpRequestContext& ctx) -> std::unique_ptr<SchemaController> {
    return std::unique_ptr<SchemaController>(new SchemaController(ctx));
}

SchemaController::SchemaController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

SchemaController::~SchemaController() = default;

void SchemaController::register_routes(httplib::Server& server) {
    server.Get(R"(/api/schemas/(.+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_get_schema(req, res);
    });
}

void SchemaController::handle_get_schema(httplib::Request const& req, httplib::Response& res) {
    if (req.matches.size() < 2) {
        respond_bad_request(res, "invalid schema route");
        return;
    }
    std::string name   = req.matches[1];
    auto        schema = ctx_.schemas.readSchema(name);
    if (!schema) {
        if (schema.error().code == Error::Code::NotFound) {
            write_text_response(res, 404, errorMessage(schema.error()));
            return;
        }
        respond_error(res, schema.error());
        return;
    }
    write_json_response(res, *schema, 200);
}

} // namespace STS::Web
