#pragma once

#include <memory>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace STS::Web {

struct HttpRequestContext;

/**
 *   GET /api/schemas/state.json        active state schema
 *   GET /api/schemas/<relative path>   schema file below the schema directory
 */
class SchemaController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<SchemaController>;

    void register_routes(httplib::Server& server);

    ~SchemaController();

private:
    explicit SchemaController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;

    void handle_get_schema(httplib::Request const& req, httplib::Response& res);
};

} // namespace STS::Web
