#pragma once

#include "core/Error.hpp"
#include <statespace/web/StateServerOptions.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace STS::Web {

struct StateServerLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

// Locations under StateServerOptions::data_root.
struct StateServerLayout {
    std::filesystem::path asset_root;
    std::filesystem::path backup_file;
    std::filesystem::path thumbnail_dir;
    std::filesystem::path state_schema_dir;
    std::filesystem::path incoming_schema_file;
    std::filesystem::path outgoing_schema_file;
};

auto MakeStateServerLayout(StateServerOptions const& options) -> StateServerLayout;

int RunStateServer(StateServerOptions const& options);

int RunStateServerWithStopFlag(StateServerOptions const&             options,
                               std::atomic<bool>&                    should_stop,
                               StateServerLogHooks const&            log_hooks = {},
                               std::function<void(Expected<void>)>   on_listen = {});

void RequestStateServerStop();
void ResetStateServerStopFlag();

} // namespace STS::Web
