#include "asset/WorkerPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>

namespace STS::Asset {

WorkerPool::WorkerPool(std::size_t threadCount) {
    if (threadCount == 0)
        threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&WorkerPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& e) {
            sts_log(std::string{"WorkerPool failed to spawn worker: "} + e.what(), "WorkerPool", "Error");
            break;
        }
    }
    sts_log("WorkerPool constructed with workers=" + std::to_string(activeWorkers.load()), "WorkerPool");
}

WorkerPool::~WorkerPool() {
    shutdown();
}

auto WorkerPool::submit(std::function<void()> job) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex);
    if (shuttingDown) {
        return std::unexpected(Error{Error::Code::NotSupported, "Worker pool shutting down"});
    }
    if (workers.empty()) {
        return std::unexpected(Error{Error::Code::UnknownError, "Worker pool has no threads"});
    }
    jobs.push(std::move(job));
    jobCV.notify_one();
    return {};
}

auto WorkerPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->shuttingDown) {
            this->shuttingDown = true;
            this->jobCV.notify_all();
        }
    }
    for (auto& th : this->workers) {
        if (th.joinable())
            th.join();
    }
    this->workers.clear();
}

auto WorkerPool::size() const -> std::size_t {
    return this->workers.size();
}

auto WorkerPool::workerFunction() -> void {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });

            // Queued jobs are drained before exiting.
            if (this->shuttingDown && this->jobs.empty())
                break;

            job = std::move(jobs.front());
            jobs.pop();
        }

        try {
            job();
        } catch (std::exception const& e) {
            sts_log(std::string{"Exception in worker job: "} + e.what(), "WorkerPool", "Error");
        }
    }
    --activeWorkers;
}

} // namespace STS::Asset
