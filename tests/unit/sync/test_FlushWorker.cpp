#include "sync/FlushWorker.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace RS;
using namespace RS::Sync;
using namespace std::chrono_literals;

namespace {

class Latch {
public:
    explicit Latch(int count)
        : remaining(count) {}

    void countDown() {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (--this->remaining <= 0)
            this->cv.notify_all();
    }

    auto waitFor(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(this->mutex);
        return this->cv.wait_for(lock, timeout, [this] { return this->remaining <= 0; });
    }

private:
    std::mutex              mutex;
    std::condition_variable cv;
    int                     remaining;
};

} // namespace

TEST_SUITE("sync.flush_worker") {
    TEST_CASE("Runs submitted jobs") {
        FlushWorker      worker(2);
        std::atomic<int> counter{0};
        Latch            done(10);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(worker.submit([&] {
                            ++counter;
                            done.countDown();
                        })
                            .has_value());
        }
        REQUIRE(done.waitFor(5s));
        CHECK(counter == 10);
        CHECK(worker.size() == 2);
    }

    TEST_CASE("Zero threads still gets one worker") {
        FlushWorker worker(0);
        CHECK(worker.size() == 1);
        Latch done(1);
        REQUIRE(worker.submit([&] { done.countDown(); }).has_value());
        CHECK(done.waitFor(5s));
    }

    TEST_CASE("Shutdown drains queued jobs and refuses new ones") {
        std::atomic<int> counter{0};
        FlushWorker      worker(1);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(worker.submit([&] {
                            std::this_thread::sleep_for(2ms);
                            ++counter;
                        })
                            .has_value());
        }
        worker.shutdown();
        CHECK(counter == 5);
        CHECK(worker.isShuttingDown());

        auto refused = worker.submit([] {});
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == Error::Code::InvalidOperation);

        // A second shutdown is harmless.
        worker.shutdown();
    }

    TEST_CASE("A throwing job does not stop the worker") {
        FlushWorker worker(1);
        Latch       done(1);
        REQUIRE(worker.submit([] { throw std::runtime_error("disk on fire"); }).has_value());
        REQUIRE(worker.submit([&] { done.countDown(); }).has_value());
        CHECK(done.waitFor(5s));
    }
}
