#pragma once

#include "config/Options.hpp"
#include "core/Error.hpp"
#include "persist/CollectionLayout.hpp"
#include "store/CollectionStore.hpp"
#include "sync/FlushWorker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RS::Sync {

enum class SyncState {
    Clean,
    Dirty,
    Flushing
};

[[nodiscard]] auto syncStateToString(SyncState state) -> std::string_view;

struct FlushFailure {
    // InvalidNodeId for the manifest and for removals.
    Tree::NodeId id = Tree::InvalidNodeId;
    std::string  key;
    Error        error;
};

struct FlushReport {
    // Nothing was pending; no file was touched.
    bool                      skipped         = false;
    std::size_t               requestsWritten = 0;
    bool                      manifestWritten = false;
    std::size_t               filesRemoved    = 0;
    std::vector<FlushFailure> failures;

    [[nodiscard]] auto ok() const -> bool { return failures.empty(); }
    [[nodiscard]] auto fileOperations() const -> std::size_t {
        return requestsWritten + (manifestWritten ? 1 : 0) + filesRemoved;
    }
};

using FlushFuture = std::shared_future<Expected<FlushReport>>;

/**
 * Decides when the state of one collection is written to its directory.
 *
 * A flush snapshots the dirty work under the store lock, writes request files
 * first, then the manifest, then removes files of deleted requests, and
 * finally hands the outcome back to the store. Failed pieces stay pending for
 * the next flush. Flushes of one collection never overlap.
 */
class CollectionSynchronizer {
public:
    CollectionSynchronizer(std::shared_ptr<Store::CollectionStore> store,
                           Persist::CollectionLayout               layout,
                           SyncOptions                             options = {},
                           FlushWorker*                            worker  = nullptr);
    ~CollectionSynchronizer();

    CollectionSynchronizer(CollectionSynchronizer const&)                    = delete;
    auto operator=(CollectionSynchronizer const&) -> CollectionSynchronizer& = delete;

    [[nodiscard]] auto flush() -> Expected<FlushReport>;
    // Runs on the flush worker; without one the flush runs inline.
    [[nodiscard]] auto flushAsync() -> FlushFuture;

    // Moves the focus. Leaving a request waits for a flush already writing it;
    // if the request is still dirty it is flushed before returning and the
    // report of that flush is returned.
    [[nodiscard]] auto focus(std::optional<Tree::NodeId> target) -> Expected<std::optional<FlushReport>>;
    [[nodiscard]] auto focused() const -> std::optional<Tree::NodeId>;

    // Drops unsaved changes by reloading the persisted state.
    [[nodiscard]] auto discard() -> Expected<void>;

    // Autosync: schedules a background flush when the interval has elapsed
    // and work is pending. Returns true when a flush was scheduled.
    auto tick(std::chrono::steady_clock::time_point now) -> bool;

    [[nodiscard]] auto state() const -> Expected<SyncState>;
    auto               waitIdle() const -> void;

    [[nodiscard]] auto layout() const -> Persist::CollectionLayout const& { return this->collectionLayout; }

private:
    auto flushLocked() -> Expected<FlushReport>;
    auto flushIfDirty(Tree::NodeId id) -> Expected<std::optional<FlushReport>>;
    auto beginOutstanding() -> void;
    auto endOutstanding() -> void;

    std::shared_ptr<Store::CollectionStore> store;
    Persist::CollectionLayout               collectionLayout;
    SyncOptions                             options;
    FlushWorker*                            worker = nullptr;

    std::mutex                  flushMutex;
    mutable std::mutex          idleMutex;
    mutable std::condition_variable idleCV;
    std::size_t                 outstanding = 0;
    bool                        flushing    = false;

    mutable std::mutex                    focusMutex;
    std::optional<Tree::NodeId>           focusedId;
    std::chrono::steady_clock::time_point lastAutosync;
};

} // namespace RS::Sync
