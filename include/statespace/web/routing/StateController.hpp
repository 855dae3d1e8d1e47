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
 * Path API over the shared document:
 *   GET    /api/state/<path>        {"state": value | null}
 *   PUT    /api/state/<path>        JSON body replaces the value at <path>
 *   DELETE /api/remove-path/<path>  removes the value at <path>
 *   DELETE /api/remove/<key>        removes <key> from every mapping
 *   POST   /api/undo, /api/redo
 * Segments containing '/' are written in double quotes.
 */
class StateController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<StateController>;

    void register_routes(httplib::Server& server);

    ~StateController();

private:
    explicit StateController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;

    void handle_get_state(httplib::Request const& req, httplib::Response& res);
    void handle_put_state(httplib::Request const& req, httplib::Response& res);
    void handle_remove_path(httplib::Request const& req, httplib::Response& res);
    void handle_remove_key(httplib::Request const& req, httplib::Response& res);
    void handle_undo(httplib::Request const& req, httplib::Response& res);
    void handle_redo(httplib::Request const& req, httplib::Response& res);
};

} // namespace STS::Web
