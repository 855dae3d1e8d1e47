#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace STS::Web {

struct StateServerOptions {
    std::string  host{"127.0.0.1"};
    int          port{8000};
    std::string  data_root{"media"};
    std::string  schema_url;
    std::string  schema_dir{"schemas"};
    std::string  asset_library;
    std::int64_t backup_retention_seconds{86400};
    std::int64_t history_limit{256};
    std::int64_t download_workers{8};
    bool         download_assets{true};
    bool         show_help{false};
};

auto ParseStateServerArguments(int argc, char** argv) -> std::optional<StateServerOptions>;

void PrintStateServerUsage();

bool ApplyStateServerEnvOverrides(StateServerOptions& options);

auto ValidateStateServerOptions(StateServerOptions const& options) -> std::optional<std::string>;

bool IsValidStateServerPort(int port);

} // namespace STS::Web
