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

namespace RS::Sync {

/**
 * Small thread pool running background flushes.
 *
 * Jobs are plain callables. After shutdown() no new job is accepted; jobs
 * already queued still run before the workers exit.
 */
class FlushWorker {
public:
    explicit FlushWorker(std::size_t threadCount = 2);
    ~FlushWorker();

    FlushWorker(FlushWorker const&)                    = delete;
    auto operator=(FlushWorker const&) -> FlushWorker& = delete;

    [[nodiscard]] auto submit(std::function<void()> job) -> Expected<void>;
    auto               shutdown() -> void;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto isShuttingDown() const -> bool { return this->shuttingDown.load(); }

private:
    auto workerFunction(std::size_t index) -> void;

    std::vector<std::jthread>         workers;
    std::queue<std::function<void()>> jobs;
    mutable std::mutex                mutex;
    std::condition_variable           jobCV;
    std::atomic<bool>                 shuttingDown{false};
};

} // namespace RS::Sync
