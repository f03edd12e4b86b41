#include "sync/FlushWorker.hpp"

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>

namespace RS::Sync {

FlushWorker::FlushWorker(std::size_t threadCount) {
    if (threadCount == 0)
        threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i)
        this->workers.emplace_back(&FlushWorker::workerFunction, this, i);
}

FlushWorker::~FlushWorker() {
    this->shutdown();
}

auto FlushWorker::submit(std::function<void()> job) -> Expected<void> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->shuttingDown)
        return std::unexpected(Error{Error::Code::InvalidOperation, "Flush worker is shutting down"});
    this->jobs.push(std::move(job));
    this->jobCV.notify_one();
    return {};
}

auto FlushWorker::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown)
            return;
        this->shuttingDown = true;
        this->jobCV.notify_all();
    }
    // jthread joins on destruction; workers drain the queue first.
    this->workers.clear();
}

auto FlushWorker::size() const -> std::size_t {
    return this->workers.size();
}

auto FlushWorker::workerFunction(std::size_t index) -> void {
    set_thread_name("FlushWorker " + std::to_string(index));
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });

            if (this->shuttingDown && this->jobs.empty())
                break;

            job = std::move(this->jobs.front());
            this->jobs.pop();
        }

        try {
            job();
        } catch (std::exception const& e) {
            rs_log(std::string{"Exception in flush job: "} + e.what(), "FlushWorker", "Error");
        }
    }
    rs_log("Flush worker exiting", "FlushWorker");
}

} // namespace RS::Sync
