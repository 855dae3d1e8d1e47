#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include "httplib.h"

#include "net/UrlFetcher.hpp"
#include "log/TaggedLogger.hpp"

#include <charconv>
#include <memory>

namespace STS::Net {

namespace {

std::unique_ptr<httplib::ClientImpl> makeHttpClient(UrlView const& url, HttpUrlFetcher::Options const& options) {
    std::unique_ptr<httplib::ClientImpl> client;
    if (url.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        auto sslClient = std::make_unique<httplib::SSLClient>(url.host, url.port);
        sslClient->enable_server_certificate_verification(options.verifyCertificates);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(sslClient));
#else
        return nullptr;
#endif
    } else {
        client = std::make_unique<httplib::ClientImpl>(url.host, url.port);
    }
    auto timeoutSeconds = static_cast<time_t>(options.timeout.count());
    client->set_connection_timeout(timeoutSeconds, 0);
    client->set_read_timeout(timeoutSeconds, 0);
    client->set_write_timeout(timeoutSeconds, 0);
    client->set_follow_location(options.followRedirects);
    client->set_keep_alive(false);
    return client;
}

} // namespace

auto parseUrl(std::string_view url) -> std::optional<UrlView> {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, schemeEnd);
    bool tls    = false;
    if (scheme == "https") {
        tls = true;
    } else if (scheme == "http") {
        tls = false;
    } else {
        return std::nullopt;
    }

    auto             remainder = url.substr(schemeEnd + 3);
    auto             slash     = remainder.find('/');
    std::string_view authority;
    std::string      path;
    if (slash == std::string_view::npos) {
        authority = remainder;
        path      = "/";
    } else {
        authority = remainder.substr(0, slash);
        path      = std::string{remainder.substr(slash)};
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string host;
    int         port  = tls ? 443 : 80;
    auto        colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        host          = std::string{authority.substr(0, colon)};
        auto portView = authority.substr(colon + 1);
        int  parsed   = 0;
        auto result   = std::from_chars(portView.data(), portView.data() + portView.size(), parsed);
        if (portView.empty() || result.ec != std::errc{} || result.ptr != portView.data() + portView.size()
            || parsed <= 0 || parsed > 65535) {
            return std::nullopt;
        }
        port = parsed;
    } else {
        host = std::string{authority};
    }

    if (host.empty()) {
        return std::nullopt;
    }
    return UrlView{std::string{scheme}, std::move(host), std::move(path), port, tls};
}

auto buildAbsoluteUrl(UrlView const& url) -> std::string {
    std::string absolute = url.scheme;
    absolute.append("://");
    absolute.append(url.host);
    bool defaultPort = (url.tls && url.port == 443) || (!url.tls && url.port == 80);
    if (!defaultPort) {
        absolute.push_back(':');
        absolute.append(std::to_string(url.port));
    }
    absolute.append(url.path);
    return absolute;
}

auto joinUrl(std::string_view base, std::string_view relative) -> std::string {
    std::string out{base};
    while (!relative.empty() && relative.front() == '/')
        relative.remove_prefix(1);
    if (out.empty())
        return std::string{relative};
    if (out.back() != '/')
        out.push_back('/');
    out.append(relative);
    return out;
}

HttpUrlFetcher::HttpUrlFetcher()
    : HttpUrlFetcher(Options{}) {}

HttpUrlFetcher::HttpUrlFetcher(Options options)
    : options(options) {}

auto HttpUrlFetcher::fetch(std::string const& url) -> Expected<std::string> {
    auto parsed = parseUrl(url);
    if (!parsed) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Unsupported URL: " + url});
    }
    auto client = makeHttpClient(*parsed, this->options);
    if (!client) {
        return std::unexpected(Error{Error::Code::NotSupported, "TLS support unavailable for " + url});
    }
    auto response = client->Get(parsed->path);
    if (!response) {
        sts_log("GET " + url + " failed: " + httplib::to_string(response.error()), "Fetch", "Error");
        return std::unexpected(Error{Error::Code::AssetFetch,
                                     "GET " + url + " failed: " + httplib::to_string(response.error())});
    }
    if (response->status != 200) {
        return std::unexpected(Error{Error::Code::AssetFetch,
                                     "GET " + url + " returned status " + std::to_string(response->status)});
    }
    return std::move(response->body);
}

} // namespace STS::Net
