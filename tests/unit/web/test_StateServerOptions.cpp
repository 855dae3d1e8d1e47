#include <doctest/doctest.h>
#include <statespace/web/StateServer.hpp>
#include <statespace/web/StateServerOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

// Clears every variable the parser reads so ambient settings cannot leak in.
struct CleanEnv {
    EnvGuard host{"STATESPACE_HOST", nullptr};
    EnvGuard port{"STATESPACE_PORT", nullptr};
    EnvGuard dataRoot{"STATESPACE_DATA_ROOT", nullptr};
    EnvGuard schemaUrl{"STATESPACE_SCHEMA_URL", nullptr};
    EnvGuard schemaDir{"STATESPACE_SCHEMA_DIR", nullptr};
    EnvGuard assetLibrary{"STATESPACE_ASSET_LIBRARY", nullptr};
    EnvGuard retention{"STATESPACE_BACKUP_RETENTION_SECONDS", nullptr};
    EnvGuard history{"STATESPACE_HISTORY_LIMIT", nullptr};
    EnvGuard workers{"STATESPACE_DOWNLOAD_WORKERS", nullptr};
    EnvGuard download{"STATESPACE_DOWNLOAD_ASSETS", nullptr};
};

} // namespace

TEST_CASE("StateServerOptions defaults are valid") {
    STS::Web::StateServerOptions options{};
    CHECK(options.host == "127.0.0.1");
    CHECK(options.port == 8000);
    CHECK(options.history_limit == 256);
    CHECK(options.download_assets);
    CHECK_FALSE(STS::Web::ValidateStateServerOptions(options).has_value());
}

TEST_CASE("StateServerOptions port helper guards range") {
    CHECK(STS::Web::IsValidStateServerPort(80));
    CHECK(STS::Web::IsValidStateServerPort(65535));
    CHECK_FALSE(STS::Web::IsValidStateServerPort(0));
    CHECK_FALSE(STS::Web::IsValidStateServerPort(70000));
}

TEST_CASE("StateServerOptions Validate detects invalid combinations") {
    STS::Web::StateServerOptions options{};
    options.port = 70000;
    auto error   = STS::Web::ValidateStateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--port") != std::string::npos);

    options.port       = 8080;
    options.schema_url = "ftp://schemas";
    error              = STS::Web::ValidateStateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--schema-url") != std::string::npos);

    options.schema_url = "";
    options.schema_dir = "";
    error              = STS::Web::ValidateStateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--schema-dir") != std::string::npos);

    options.schema_dir       = "schemas";
    options.download_workers = 0;
    error                    = STS::Web::ValidateStateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--download-workers") != std::string::npos);

    options.download_workers         = 4;
    options.backup_retention_seconds = 0;
    error                            = STS::Web::ValidateStateServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--backup-retention-seconds") != std::string::npos);
}

TEST_CASE("Command line flags override defaults") {
    CleanEnv    env;
    ArgvBuilder argv{"statespace_serve",
                     "--host",
                     "0.0.0.0",
                     "--port",
                     "9001",
                     "--data-root",
                     "/var/lib/statespace",
                     "--schema-url",
                     "https://schemas.example.org/state.json",
                     "--asset-library",
                     "https://library.example.org/assets",
                     "--history-limit",
                     "0",
                     "--download-workers",
                     "2",
                     "--no-asset-download"};
    auto parsed = STS::Web::ParseStateServerArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9001);
    CHECK(parsed->data_root == "/var/lib/statespace");
    CHECK(parsed->schema_url == "https://schemas.example.org/state.json");
    CHECK(parsed->asset_library == "https://library.example.org/assets");
    CHECK(parsed->history_limit == 0);
    CHECK(parsed->download_workers == 2);
    CHECK_FALSE(parsed->download_assets);
}

TEST_CASE("Invalid or unknown arguments are rejected") {
    CleanEnv env;
    {
        ArgvBuilder argv{"statespace_serve", "--port", "abc"};
        CHECK_FALSE(STS::Web::ParseStateServerArguments(argv.argc(), argv.argv()).has_value());
    }
    {
        ArgvBuilder argv{"statespace_serve", "--port"};
        CHECK_FALSE(STS::Web::ParseStateServerArguments(argv.argc(), argv.argv()).has_value());
    }
    {
        ArgvBuilder argv{"statespace_serve", "--schema-url", "schemas/state.json"};
        CHECK_FALSE(STS::Web::ParseStateServerArguments(argv.argc(), argv.argv()).has_value());
    }
    {
        ArgvBuilder argv{"statespace_serve", "--bogus"};
        CHECK_FALSE(STS::Web::ParseStateServerArguments(argv.argc(), argv.argv()).has_value());
    }
}

TEST_CASE("Help flag is reported without further parsing") {
    CleanEnv    env;
    ArgvBuilder argv{"statespace_serve", "--help", "--bogus"};
    auto        parsed = STS::Web::ParseStateServerArguments(argv.argc(), argv.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->show_help);
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    CleanEnv env;
    EnvGuard host{"STATESPACE_HOST", "0.0.0.0"};
    EnvGuard port{"STATESPACE_PORT", "9090"};
    EnvGuard download{"STATESPACE_DOWNLOAD_ASSETS", "no"};

    ArgvBuilder argv{"statespace_serve"};
    auto        parsed = STS::Web::ParseStateServerArguments(argv.argc(), argv.argv());

    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9090);
    CHECK_FALSE(parsed->download_assets);
}

TEST_CASE("Command line wins over the environment") {
    CleanEnv    env;
    EnvGuard    port{"STATESPACE_PORT", "9090"};
    ArgvBuilder argv{"statespace_serve", "--port", "7000"};
    auto        parsed = STS::Web::ParseStateServerArguments(argv.argc(), argv.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->port == 7000);
}

TEST_CASE("Malformed environment values fail parsing") {
    CleanEnv    env;
    EnvGuard    workers{"STATESPACE_DOWNLOAD_WORKERS", "many"};
    ArgvBuilder argv{"statespace_serve"};
    CHECK_FALSE(STS::Web::ParseStateServerArguments(argv.argc(), argv.argv()).has_value());
}

TEST_CASE("Server layout places everything under the configured roots") {
    STS::Web::StateServerOptions options{};
    options.data_root  = "/data";
    options.schema_dir = "/schemas";
    auto layout        = STS::Web::MakeStateServerLayout(options);
    CHECK(layout.asset_root == std::filesystem::path{"/data/visassets"});
    CHECK(layout.backup_file == std::filesystem::path{"/data/state-backups.json"});
    CHECK(layout.thumbnail_dir == std::filesystem::path{"/data/thumbnails"});
    CHECK(layout.state_schema_dir == std::filesystem::path{"/schemas/state"});
    CHECK(layout.incoming_schema_file == std::filesystem::path{"/schemas/messages/ws-incoming.json"});
}
