#include "sync/CollectionSynchronizer.hpp"

#include "codec/CollectionCodec.hpp"
#include "log/TaggedLogger.hpp"
#include "persist/CollectionLoader.hpp"
#include "persist/FileUtils.hpp"

namespace RS::Sync {

namespace {

auto codecEncoders() -> Store::FlushEncoders {
    return Store::FlushEncoders{
            .request  = [](Tree::Node const& node) { return Codec::encodeRequest(node); },
            .manifest = [](Tree::CollectionInfo const& info, Tree::Node const& root) {
                return Codec::encodeManifest(info, root);
            }};
}

auto readyFuture(Expected<FlushReport> value) -> FlushFuture {
    std::promise<Expected<FlushReport>> promise;
    promise.set_value(std::move(value));
    return promise.get_future().share();
}

} // namespace

auto syncStateToString(SyncState state) -> std::string_view {
    switch (state) {
    case SyncState::Clean:
        return "clean";
    case SyncState::Dirty:
        return "dirty";
    case SyncState::Flushing:
        return "flushing";
    }
    return "clean";
}

CollectionSynchronizer::CollectionSynchronizer(std::shared_ptr<Store::CollectionStore> store,
                                               Persist::CollectionLayout               layout,
                                               SyncOptions                             options,
                                               FlushWorker*                            worker)
    : store(std::move(store)),
      collectionLayout(std::move(layout)),
      options(options),
      worker(worker),
      lastAutosync(std::chrono::steady_clock::now()) {}

CollectionSynchronizer::~CollectionSynchronizer() {
    this->waitIdle();
}

auto CollectionSynchronizer::beginOutstanding() -> void {
    std::lock_guard<std::mutex> lock(this->idleMutex);
    ++this->outstanding;
}

auto CollectionSynchronizer::endOutstanding() -> void {
    std::lock_guard<std::mutex> lock(this->idleMutex);
    --this->outstanding;
    this->idleCV.notify_all();
}

auto CollectionSynchronizer::waitIdle() const -> void {
    std::unique_lock<std::mutex> lock(this->idleMutex);
    this->idleCV.wait(lock, [this] { return this->outstanding == 0; });
}

auto CollectionSynchronizer::flush() -> Expected<FlushReport> {
    this->beginOutstanding();
    auto result = [this] {
        std::lock_guard<std::mutex> lock(this->flushMutex);
        return this->flushLocked();
    }();
    this->endOutstanding();
    return result;
}

auto CollectionSynchronizer::flushAsync() -> FlushFuture {
    if (this->worker == nullptr)
        return readyFuture(this->flush());

    auto task   = std::make_shared<std::packaged_task<Expected<FlushReport>()>>([this] {
        std::lock_guard<std::mutex> lock(this->flushMutex);
        return this->flushLocked();
    });
    auto future = task->get_future().share();

    this->beginOutstanding();
    auto submitted = this->worker->submit([this, task] {
        (*task)();
        this->endOutstanding();
    });
    if (!submitted) {
        this->endOutstanding();
        return readyFuture(std::unexpected(submitted.error()));
    }
    return future;
}

auto CollectionSynchronizer::flushLocked() -> Expected<FlushReport> {
    auto snapshot = this->store->takeFlushSnapshot(codecEncoders());
    if (!snapshot)
        return std::unexpected(snapshot.error());

    FlushReport report;
    if (snapshot->empty()) {
        report.skipped = true;
        rs_log("Nothing to flush in " + this->collectionLayout.dir().string(), "Sync", "INFO");
        return report;
    }

    {
        std::lock_guard<std::mutex> lock(this->idleMutex);
        this->flushing = true;
    }

    Store::FlushOutcome outcome;
    for (auto const& write : snapshot->requests) {
        auto path    = this->collectionLayout.requestPath(write.key);
        auto written = path ? Persist::writeFileAtomic(*path, write.bytes, this->options.fsyncData)
                            : Expected<void>{std::unexpected(path.error())};
        if (written) {
            ++report.requestsWritten;
            continue;
        }
        rs_log("Failed to write request " + write.key + ": " + describeError(written.error()), "Sync", "Error");
        outcome.failedRequests.push_back(write.id);
        report.failures.push_back(FlushFailure{.id = write.id, .key = write.key, .error = written.error()});
    }

    bool manifestSettled = outcome.failedRequests.empty();
    if (manifestSettled && snapshot->manifest) {
        auto written = Persist::writeFileAtomic(this->collectionLayout.manifestPath(), *snapshot->manifest,
                                                this->options.fsyncData);
        if (written) {
            outcome.manifestWritten = true;
            report.manifestWritten  = true;
        } else {
            rs_log("Failed to write manifest: " + describeError(written.error()), "Sync", "Error");
            report.failures.push_back(FlushFailure{.id = Tree::InvalidNodeId, .key = {}, .error = written.error()});
            manifestSettled = false;
        }
    }

    // Files of deleted requests go only after the manifest no longer names them.
    for (auto const& key : snapshot->removals) {
        if (!manifestSettled) {
            outcome.unremovedKeys.push_back(key);
            continue;
        }
        auto path    = this->collectionLayout.requestPath(key);
        auto removed = path ? Persist::removeFileIfExists(*path) : Expected<void>{std::unexpected(path.error())};
        if (removed) {
            ++report.filesRemoved;
            continue;
        }
        outcome.unremovedKeys.push_back(key);
        report.failures.push_back(FlushFailure{.id = Tree::InvalidNodeId, .key = key, .error = removed.error()});
    }

    bool const stillPending = this->store->reconcileFlush(*snapshot, outcome);
    {
        std::lock_guard<std::mutex> lock(this->idleMutex);
        this->flushing = false;
    }
    rs_log("Flushed " + this->collectionLayout.dir().string() + ": " + std::to_string(report.requestsWritten)
                   + " request(s), manifest " + (report.manifestWritten ? "written" : "unchanged") + ", "
                   + std::to_string(report.filesRemoved) + " removed, " + std::to_string(report.failures.size())
                   + " failure(s)" + (stillPending ? ", work pending" : ""),
           "Sync");
    return report;
}

auto CollectionSynchronizer::focus(std::optional<Tree::NodeId> target) -> Expected<std::optional<FlushReport>> {
    std::lock_guard<std::mutex> lock(this->focusMutex);

    if (target) {
        auto exists = this->store->withTree([&](Tree::CollectionTree const& tree) { return tree.find(*target) != nullptr; });
        if (!exists)
            return std::unexpected(exists.error());
        if (!*exists)
            return std::unexpected(Error{Error::Code::NotFound, "No node with id " + std::to_string(*target)});
    }

    std::optional<FlushReport> report;
    if (this->focusedId && this->focusedId != target) {
        auto const previous       = *this->focusedId;
        auto       leavingRequest = this->store->withTree([&](Tree::CollectionTree const& tree) {
            Tree::Node const* node = tree.find(previous);
            return node != nullptr && node->isRequest();
        });
        if (!leavingRequest)
            return std::unexpected(leavingRequest.error());
        if (*leavingRequest) {
            auto flushed = this->flushIfDirty(previous);
            if (!flushed)
                return std::unexpected(flushed.error());
            report = std::move(*flushed);
        }
    }
    this->focusedId = target;
    return report;
}

auto CollectionSynchronizer::flushIfDirty(Tree::NodeId id) -> Expected<std::optional<FlushReport>> {
    this->beginOutstanding();
    auto result = [&]() -> Expected<std::optional<FlushReport>> {
        // A background flush may hold the request's snapshot; its outcome is
        // reconciled before flushMutex is released.
        std::lock_guard<std::mutex> lock(this->flushMutex);
        auto                        dirty = this->store->isDirty(id);
        if (!dirty && dirty.error().code != Error::Code::NotFound)
            return std::unexpected(dirty.error());
        if (!dirty || !*dirty)
            return std::nullopt;
        rs_log("Leaving dirty request " + std::to_string(id) + ", flushing", "Sync");
        auto flushed = this->flushLocked();
        if (!flushed)
            return std::unexpected(flushed.error());
        return std::optional<FlushReport>{std::move(*flushed)};
    }();
    this->endOutstanding();
    return result;
}

auto CollectionSynchronizer::focused() const -> std::optional<Tree::NodeId> {
    std::lock_guard<std::mutex> lock(this->focusMutex);
    return this->focusedId;
}

auto CollectionSynchronizer::discard() -> Expected<void> {
    {
        std::lock_guard<std::mutex> flushLock(this->flushMutex);
        if (this->collectionLayout.hasManifest()) {
            auto loaded = Persist::loadCollection(this->collectionLayout);
            if (!loaded)
                return std::unexpected(loaded.error());
            this->store->replaceContents(std::move(loaded->root), std::move(loaded->info), std::move(loaded->orphanKeys));
        } else {
            auto info = this->store->info();
            if (!info)
                return std::unexpected(info.error());
            this->store->replaceContents(Tree::Node::makeDirectory("root"), std::move(*info), {});
        }
    }

    // focus() flushes while holding focusMutex, so it is never taken under flushMutex.
    {
        std::lock_guard<std::mutex> lock(this->focusMutex);
        this->focusedId.reset();
    }
    rs_log("Discarded changes in " + this->collectionLayout.dir().string(), "Sync");
    return {};
}

auto CollectionSynchronizer::tick(std::chrono::steady_clock::time_point now) -> bool {
    if (!this->options.autosync)
        return false;
    {
        std::lock_guard<std::mutex> lock(this->focusMutex);
        if (now - this->lastAutosync < this->options.autosyncInterval)
            return false;
        this->lastAutosync = now;
    }
    {
        std::lock_guard<std::mutex> lock(this->idleMutex);
        if (this->outstanding > 0)
            return false;
    }
    auto pending = this->store->hasPendingWork();
    if (!pending || !*pending)
        return false;
    rs_log("Autosync of " + this->collectionLayout.dir().string(), "Sync", "INFO");
    [[maybe_unused]] auto scheduled = this->flushAsync();
    return true;
}

auto CollectionSynchronizer::state() const -> Expected<SyncState> {
    {
        std::lock_guard<std::mutex> lock(this->idleMutex);
        if (this->flushing)
            return SyncState::Flushing;
    }
    auto pending = this->store->hasPendingWork();
    if (!pending)
        return std::unexpected(pending.error());
    return *pending ? SyncState::Dirty : SyncState::Clean;
}

} // namespace RS::Sync
