#pragma once

#include "config/Options.hpp"
#include "core/Error.hpp"
#include "persist/CollectionCatalog.hpp"
#include "store/CollectionStore.hpp"
#include "sync/CollectionSynchronizer.hpp"
#include "sync/FlushWorker.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace RS::App {

// One open collection: its store and the synchronizer writing it back.
class CollectionSession {
public:
    CollectionSession(std::filesystem::path                         dir,
                      std::shared_ptr<Store::CollectionStore>       store,
                      std::unique_ptr<Sync::CollectionSynchronizer> synchronizer);

    [[nodiscard]] auto dir() const -> std::filesystem::path const& { return this->collectionDir; }
    [[nodiscard]] auto store() -> Store::CollectionStore& { return *this->collectionStore; }
    [[nodiscard]] auto sync() -> Sync::CollectionSynchronizer& { return *this->synchronizer; }

    // Writes the in-memory state, unsaved edits included, as one document.
    [[nodiscard]] auto exportTo(std::filesystem::path const& target, bool fsyncData = true) const -> Expected<void>;

private:
    std::filesystem::path                         collectionDir;
    std::shared_ptr<Store::CollectionStore>       collectionStore;
    std::unique_ptr<Sync::CollectionSynchronizer> synchronizer;
};

enum class CloseMode {
    Flush,
    Discard
};

/**
 * Registry of open collections below one collections directory.
 *
 * All sessions share one FlushWorker. Collections are keyed by their
 * directory; opening an already open collection returns the same session.
 */
class Workspace {
public:
    explicit Workspace(WorkspaceOptions options = {});
    ~Workspace();

    Workspace(Workspace const&)                    = delete;
    auto operator=(Workspace const&) -> Workspace& = delete;

    // Resolves the collections directory (see resolveCollectionsDir) and creates it.
    [[nodiscard]] auto collectionsDir() const -> Expected<std::filesystem::path>;

    [[nodiscard]] auto list(Persist::CollectionSorting sorting = Persist::CollectionSorting::Recent) const
            -> Expected<std::vector<Persist::CollectionMeta>>;

    [[nodiscard]] auto open(std::filesystem::path const& dir) -> Expected<std::shared_ptr<CollectionSession>>;
    [[nodiscard]] auto create(std::string const& name, std::string const& description = {})
            -> Expected<std::shared_ptr<CollectionSession>>;
    [[nodiscard]] auto importDocument(std::filesystem::path const& document) -> Expected<std::shared_ptr<CollectionSession>>;
    [[nodiscard]] auto session(std::filesystem::path const& dir) const -> std::shared_ptr<CollectionSession>;
    [[nodiscard]] auto openCount() const -> std::size_t;

    // Closed collections only.
    [[nodiscard]] auto renameCollection(std::filesystem::path const& dir, std::string const& newName)
            -> Expected<std::filesystem::path>;
    [[nodiscard]] auto deleteCollection(std::filesystem::path const& dir) -> Expected<void>;

    // Waits for an in-flight flush, then flushes or discards and unregisters.
    // Discarding reloads the persisted state, so nothing unsaved is written
    // later. A failed flush or reload keeps the session open.
    [[nodiscard]] auto close(std::filesystem::path const& dir, CloseMode mode) -> Expected<void>;

    // Autosync for every open session; returns the number of flushes scheduled.
    auto tick(std::chrono::steady_clock::time_point now) -> std::size_t;

    // Flushes every session and stops the worker. Returns the first failure;
    // sessions whose flush failed stay open.
    [[nodiscard]] auto shutdown() -> Expected<void>;

private:
    [[nodiscard]] auto normalize(std::filesystem::path const& dir) const -> std::filesystem::path;
    [[nodiscard]] auto makeSession(std::filesystem::path const& dir) -> Expected<std::shared_ptr<CollectionSession>>;
    [[nodiscard]] auto closeSession(std::shared_ptr<CollectionSession> const& session, CloseMode mode) -> Expected<void>;

    WorkspaceOptions                                                   options;
    std::unique_ptr<Sync::FlushWorker>                                 worker;
    mutable std::mutex                                                 mutex;
    std::map<std::filesystem::path, std::shared_ptr<CollectionSession>> sessions;
};

} // namespace RS::App
