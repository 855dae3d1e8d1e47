#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace STS::Asset {

/**
 * Fixed-size pool of worker threads draining a FIFO job queue. Jobs are plain
 * callables; completion tracking is the submitter's concern. Exceptions
 * escaping a job are logged and do not stop the worker.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount = 8);
    ~WorkerPool();

    WorkerPool(WorkerPool const&)                    = delete;
    auto operator=(WorkerPool const&) -> WorkerPool& = delete;

    auto submit(std::function<void()> job) -> Expected<void>;
    auto shutdown() -> void;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread>         workers;
    std::queue<std::function<void()>> jobs;
    std::mutex                        mutex;
    std::condition_variable           jobCV;
    std::atomic<bool>                 shuttingDown{false};
    std::atomic<std::size_t>          activeWorkers{0};
};

} // namespace STS::Asset
