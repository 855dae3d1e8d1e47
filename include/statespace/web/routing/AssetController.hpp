#pragma once

#include <memory>

namespace httplib {
class Server;
class Request;
class Response;
} // namespace httplib

namespace STS::Web {

struct HttpRequestContext;

class AssetController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<AssetController>;

    void register_routes(httplib::Server& server);

    ~AssetController();

private:
    explicit AssetController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;

    void handle_list(httplib::Request const& req, httplib::Response& res);
    void handle_download(httplib::Request const& req, httplib::Response& res);
    void handle_remove(httplib::Request const& req, httplib::Response& res);
    void handle_save_local(httplib::Request const& req, httplib::Response& res);
};

} // namespace STS::Web
