#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace RS {

/**
 * Asynchronous tagged logger.
 *
 * Messages are queued by the caller and written to stderr by a worker thread.
 * Output is disabled unless enabled at runtime, either through
 * setLoggingEnabled() or the environment:
 *   REQSTORE_LOG / REQSTORE_LOG_ENABLED    any value other than "0" enables output
 *   REQSTORE_LOG_ENABLE_TAGS               comma list; every tag of a message must be listed
 *   REQSTORE_LOG_SKIP_TAGS                 comma list appended to the skip set
 *   REQSTORE_LOG_CLEAR_DEFAULT_SKIPS       drop the built-in skip set
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool { return enabled.load(std::memory_order_relaxed); }

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       enabled;
    std::set<std::string>   skipTags{"INFO", "Trace", "FlushWorker"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        applyEnvironment() -> void;
    auto        processQueue() -> void;
    auto        shouldWrite(const LogMessage& msg) const -> bool;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled)
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace RS

#ifdef RS_LOG_DEBUG
#define rs_log(message, ...) ::RS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)
#else
#define rs_log(message, ...) ((void)0)
#endif // RS_LOG_DEBUG
