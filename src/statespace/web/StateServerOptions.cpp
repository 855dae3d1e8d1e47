#include <statespace/web/StateServerOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace STS::Web {

namespace {

constexpr std::int64_t kMaxDownloadWorkers = 256;

bool is_http_url(std::string_view value) {
    return value.starts_with("http://") || value.starts_with("https://");
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidStateServerPort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateStateServerOptions(StateServerOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidStateServerPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.data_root.empty()) {
        return std::string{"--data-root must not be empty"};
    }
    if (!options.schema_url.empty() && !is_http_url(options.schema_url)) {
        return std::string{"--schema-url must be an absolute http(s) URL"};
    }
    if (options.schema_url.empty() && options.schema_dir.empty()) {
        return std::string{"--schema-url or --schema-dir is required"};
    }
    if (!options.asset_library.empty() && !is_http_url(options.asset_library)) {
        return std::string{"--asset-library must be an absolute http(s) URL"};
    }
    if (options.backup_retention_seconds <= 0) {
        return std::string{"--backup-retention-seconds must be > 0"};
    }
    if (options.history_limit < 0) {
        return std::string{"--history-limit must be >= 0"};
    }
    if (options.download_workers < 1 || options.download_workers > kMaxDownloadWorkers) {
        return std::string{"--download-workers must be within 1-256"};
    }
    return std::nullopt;
}

bool ApplyStateServerEnvOverrides(StateServerOptions& options) {
    auto apply_non_empty = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << key << " must not be empty\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    auto apply_http_env = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (!is_http_url(value)) {
                std::cerr << key << " must be an absolute http(s) URL\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    auto apply_i64_env = [&](char const* key, std::int64_t min, std::int64_t max, std::int64_t& target) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, min, max, parsed)) {
                std::cerr << key << " must be within " << min << '-' << max << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    if (!apply_non_empty("STATESPACE_HOST", options.host)) {
        return false;
    }

    if (!apply_env("STATESPACE_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "STATESPACE_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_non_empty("STATESPACE_DATA_ROOT", options.data_root)) {
        return false;
    }
    if (!apply_http_env("STATESPACE_SCHEMA_URL", options.schema_url)) {
        return false;
    }
    if (!apply_non_empty("STATESPACE_SCHEMA_DIR", options.schema_dir)) {
        return false;
    }
    if (!apply_http_env("STATESPACE_ASSET_LIBRARY", options.asset_library)) {
        return false;
    }
    if (!apply_i64_env("STATESPACE_BACKUP_RETENTION_SECONDS",
                       1,
                       std::numeric_limits<std::int64_t>::max(),
                       options.backup_retention_seconds)) {
        return false;
    }
    if (!apply_i64_env("STATESPACE_HISTORY_LIMIT", 0, std::numeric_limits<std::int64_t>::max(), options.history_limit)) {
        return false;
    }
    if (!apply_i64_env("STATESPACE_DOWNLOAD_WORKERS", 1, kMaxDownloadWorkers, options.download_workers)) {
        return false;
    }

    if (!apply_env("STATESPACE_DOWNLOAD_ASSETS", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "STATESPACE_DOWNLOAD_ASSETS must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.download_assets = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintStateServerUsage() {
    std::cout << "Usage: statespace_serve [options]\n"
              << "  --host <host>           Bind address (default 127.0.0.1)\n"
              << "  --port <port>           Bind port (default 8000)\n"
              << "  --data-root <dir>       Assets, backups and thumbnails (default media)\n"
              << "  --schema-url <url>      State schema location (offline when omitted)\n"
              << "  --schema-dir <dir>      State and message schemas (default schemas)\n"
              << "  --asset-library <url>   Default asset library base URL\n"
              << "  --backup-retention-seconds <n> Age after which backups are pruned (default 86400)\n"
              << "  --history-limit <n>     Undo entries kept, 0 for unlimited (default 256)\n"
              << "  --download-workers <n>  Concurrent asset downloads (default 8)\n"
              << "  --no-asset-download     Do not resolve assets referenced by the state\n"
              << "  --help                  Show this help\n";
}

std::optional<StateServerOptions> ParseStateServerArguments(int argc, char** argv) {
    StateServerOptions options{};
    if (!ApplyStateServerEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto require_i64 = [&](int& index, std::string_view flag, std::int64_t min, std::int64_t max, std::int64_t& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, min, max, parsed)) {
            std::cerr << flag << " must be within " << min << '-' << max << "\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--data-root") {
            if (auto value = require_value(i, "--data-root")) {
                options.data_root = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--schema-url") {
            if (auto value = require_value(i, "--schema-url")) {
                if (!is_http_url(*value)) {
                    std::cerr << "--schema-url must be an absolute http(s) URL\n";
                    return std::nullopt;
                }
                options.schema_url = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--schema-dir") {
            if (auto value = require_value(i, "--schema-dir")) {
                options.schema_dir = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--asset-library") {
            if (auto value = require_value(i, "--asset-library")) {
                if (!is_http_url(*value)) {
                    std::cerr << "--asset-library must be an absolute http(s) URL\n";
                    return std::nullopt;
                }
                options.asset_library = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--backup-retention-seconds") {
            if (!require_i64(i,
                             "--backup-retention-seconds",
                             1,
                             std::numeric_limits<std::int64_t>::max(),
                             options.backup_retention_seconds)) {
                return std::nullopt;
            }
        } else if (arg == "--history-limit") {
            if (!require_i64(i, "--history-limit", 0, std::numeric_limits<std::int64_t>::max(), options.history_limit)) {
                return std::nullopt;
            }
        } else if (arg == "--download-workers") {
            if (!require_i64(i, "--download-workers", 1, kMaxDownloadWorkers, options.download_workers)) {
                return std::nullopt;
            }
        } else if (arg == "--no-asset-download") {
            options.download_assets = false;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateStateServerOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace STS::Web
