#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef STS_LOG_DEBUG

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class ScopedEnv {
public:
    ScopedEnv(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str()))
            this->original = std::string(existing);
        if (value)
            setenv(this->key.c_str(), value, 1);
        else
            unsetenv(this->key.c_str());
    }

    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

    ~ScopedEnv() {
        if (this->original)
            setenv(this->key.c_str(), this->original->c_str(), 1);
        else
            unsetenv(this->key.c_str());
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

// Every logging variable cleared, then the given overrides applied on top.
class LogEnvironment {
public:
    explicit LogEnvironment(std::initializer_list<std::pair<const char*, const char*>> overrides = {}) {
        for (auto const* name : {"STATESPACE_LOG_ENABLED",
                                 "STATESPACE_LOG",
                                 "STATESPACE_LOG_CLEAR_DEFAULT_SKIPS",
                                 "STATESPACE_LOG_ENABLE_TAGS",
                                 "STATESPACE_LOG_SKIP_TAGS"})
            this->guards.push_back(std::make_unique<ScopedEnv>(name, nullptr));
        for (auto const& [name, value] : overrides)
            this->guards.push_back(std::make_unique<ScopedEnv>(name, value));
    }

private:
    std::vector<std::unique_ptr<ScopedEnv>> guards;
};

auto captureStderr(std::function<void()> const& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

// Logs one message through a fresh logger; the destructor drains the queue.
template <typename... Tags>
auto logOnce(std::string const& message, Tags... tags) -> std::string {
    return captureStderr([&] {
        STS::TaggedLogger logger;
        logger.log_impl(message, std::source_location::current(), tags...);
        std::this_thread::sleep_for(20ms);
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("output is off unless the environment enables it") {
    LogEnvironment env;
    CHECK(logOnce("should not appear", "Store").empty());
}

TEST_CASE("either enable variable turns output on") {
    SUBCASE("STATESPACE_LOG_ENABLED") {
        LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}};
        auto           output = logOnce("commit applied", "Store");
        CHECK(output.find("[Store]") != std::string::npos);
        CHECK(output.find("commit applied") != std::string::npos);
        CHECK(output.find("Thread 0") != std::string::npos);
    }
    SUBCASE("STATESPACE_LOG") {
        LogEnvironment env{{"STATESPACE_LOG", "on"}};
        CHECK(logOnce("subscriber joined", "Notifier").find("subscriber joined") != std::string::npos);
    }
    SUBCASE("zero keeps it off") {
        LogEnvironment env{{"STATESPACE_LOG_ENABLED", "0"}};
        CHECK(logOnce("quiet", "Store").empty());
    }
}

TEST_CASE("default skip list hides INFO until cleared") {
    {
        LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}};
        CHECK(logOnce("filtered", "INFO").empty());
    }
    {
        LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}, {"STATESPACE_LOG_CLEAR_DEFAULT_SKIPS", "1"}};
        CHECK(logOnce("info allowed", "INFO").find("info allowed") != std::string::npos);
    }
}

TEST_CASE("enabled tags require every tag of a message to match") {
    LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}, {"STATESPACE_LOG_ENABLE_TAGS", "Assets"}};
    CHECK(logOnce("fetched", "Assets").find("fetched") != std::string::npos);
    CHECK(logOnce("mixed", "Assets", "Store").empty());
}

TEST_CASE("skip tags are trimmed and extend the filter") {
    LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"},
                       {"STATESPACE_LOG_CLEAR_DEFAULT_SKIPS", "1"},
                       {"STATESPACE_LOG_SKIP_TAGS", " Noisy , Backup "}};
    CHECK(logOnce("dropped", "Backup").empty());
    CHECK(logOnce("dropped too", "Noisy").empty());
    CHECK(logOnce("kept", "Store").find("kept") != std::string::npos);
}

TEST_CASE("named threads appear in the output") {
    LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}};
    auto           output = captureStderr([] {
        STS::TaggedLogger logger;
        logger.setThreadName("asset-worker-3");
        logger.log_impl("downloading", std::source_location::current(), "Assets");
        std::this_thread::sleep_for(20ms);
    });
    CHECK(output.find("[asset-worker-3]") != std::string::npos);
}

TEST_CASE("setLoggingEnabled overrides the environment") {
    LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}};

    auto suppressed = captureStderr([] {
        STS::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        CHECK_FALSE(logger.isLoggingEnabled());
        logger.log_impl("disabled", std::source_location::current(), "Store");
        std::this_thread::sleep_for(20ms);
    });
    CHECK(suppressed.empty());
}

TEST_CASE("the sts_log macro joins tags on the shared logger") {
    LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}};

    auto output = captureStderr([] {
        STS::set_thread_name("http-worker");
        STS::set_logging_enabled(true);
        sts_log("via macro", "Web", "Error");
        std::this_thread::sleep_for(50ms);
        STS::set_logging_enabled(false);
    });

    CHECK(output.find("Error][Web") != std::string::npos);
    CHECK(output.find("[http-worker]") != std::string::npos);
}

TEST_CASE("source locations keep one parent directory") {
    LogEnvironment env{{"STATESPACE_LOG_ENABLED", "1"}};

    auto output = captureStderr([] {
        STS::TaggedLogger logger;
#line 42 "src/statespace/state/StateStore.cpp"
        logger.log_impl("located", std::source_location::current(), "Store");
#line 187 "tests/unit/log/test_TaggedLogger.cpp"
        std::this_thread::sleep_for(20ms);
    });

    CHECK(output.find("state/StateStore.cpp:42") != std::string::npos);
}

} // TEST_SUITE

#endif // STS_LOG_DEBUG
