#include "app/Workspace.hpp"

#include "codec/CollectionCodec.hpp"
#include "config/DataPaths.hpp"
#include "log/TaggedLogger.hpp"
#include "persist/CollectionLoader.hpp"
#include "persist/FileUtils.hpp"

#include <optional>
#include <system_error>

namespace RS::App {

CollectionSession::CollectionSession(std::filesystem::path                         dir,
                                     std::shared_ptr<Store::CollectionStore>       store,
                                     std::unique_ptr<Sync::CollectionSynchronizer> synchronizer)
    : collectionDir(std::move(dir)), collectionStore(std::move(store)), synchronizer(std::move(synchronizer)) {}

auto CollectionSession::exportTo(std::filesystem::path const& target, bool fsyncData) const -> Expected<void> {
    auto info = this->collectionStore->info();
    if (!info)
        return std::unexpected(info.error());
    auto document = this->collectionStore->withTree(
            [&](Tree::CollectionTree const& tree) { return Codec::encodeDocument(*info, tree.root()); });
    if (!document)
        return std::unexpected(document.error());
    return Persist::writeFileAtomic(target, *document, fsyncData);
}

Workspace::Workspace(WorkspaceOptions options)
    : options(std::move(options)), worker(std::make_unique<Sync::FlushWorker>(this->options.flushThreads)) {}

Workspace::~Workspace() {
    if (this->worker->isShuttingDown())
        return;
    if (auto result = this->shutdown(); !result)
        rs_log("Workspace shutdown left unsaved changes: " + describeError(result.error()), "Workspace", "Error");
}

auto Workspace::collectionsDir() const -> Expected<std::filesystem::path> {
    auto dir = this->options.collectionsDir.empty() ? resolveCollectionsDir()
                                                    : Expected<std::filesystem::path>{this->options.collectionsDir};
    if (!dir)
        return dir;
    if (auto ensured = ensureDirectory(*dir); !ensured)
        return std::unexpected(ensured.error());
    return dir;
}

auto Workspace::normalize(std::filesystem::path const& dir) const -> std::filesystem::path {
    std::error_code ec;
    auto            canonical = std::filesystem::weakly_canonical(dir, ec);
    if (ec)
        return std::filesystem::absolute(dir, ec).lexically_normal();
    return canonical;
}

auto Workspace::list(Persist::CollectionSorting sorting) const -> Expected<std::vector<Persist::CollectionMeta>> {
    auto dir = this->collectionsDir();
    if (!dir)
        return std::unexpected(dir.error());
    return Persist::listCollections(*dir, sorting);
}

auto Workspace::makeSession(std::filesystem::path const& dir) -> Expected<std::shared_ptr<CollectionSession>> {
    Persist::CollectionLayout layout{dir};
    auto                      loaded = Persist::loadCollection(layout);
    if (!loaded) {
        rs_log("Failed to open " + dir.string() + ": " + describeError(loaded.error()), "Workspace", "Error");
        return std::unexpected(loaded.error());
    }

    auto store = std::make_shared<Store::CollectionStore>(std::move(loaded->root),
                                                          std::move(loaded->info),
                                                          this->options.store,
                                                          std::move(loaded->orphanKeys));
    auto sync  = std::make_unique<Sync::CollectionSynchronizer>(store, layout, this->options.sync, this->worker.get());
    return std::make_shared<CollectionSession>(dir, std::move(store), std::move(sync));
}

auto Workspace::open(std::filesystem::path const& dir) -> Expected<std::shared_ptr<CollectionSession>> {
    auto                        key = this->normalize(dir);
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->worker->isShuttingDown())
        return std::unexpected(Error{Error::Code::InvalidOperation, "Workspace is shut down"});
    if (auto it = this->sessions.find(key); it != this->sessions.end())
        return it->second;

    auto session = this->makeSession(key);
    if (!session)
        return session;
    this->sessions.emplace(key, *session);
    rs_log("Opened " + key.string(), "Workspace");
    return session;
}

auto Workspace::create(std::string const& name, std::string const& description)
        -> Expected<std::shared_ptr<CollectionSession>> {
    auto dir = this->collectionsDir();
    if (!dir)
        return std::unexpected(dir.error());
    auto created = Persist::createCollection(*dir, name, description, this->options.sync.fsyncData);
    if (!created)
        return std::unexpected(created.error());
    return this->open(*created);
}

auto Workspace::importDocument(std::filesystem::path const& document) -> Expected<std::shared_ptr<CollectionSession>> {
    auto dir = this->collectionsDir();
    if (!dir)
        return std::unexpected(dir.error());
    auto imported = Persist::importCollection(*dir, document, this->options.sync.fsyncData);
    if (!imported)
        return std::unexpected(imported.error());
    return this->open(*imported);
}

auto Workspace::session(std::filesystem::path const& dir) const -> std::shared_ptr<CollectionSession> {
    auto                        key = this->normalize(dir);
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->sessions.find(key);
    return it == this->sessions.end() ? nullptr : it->second;
}

auto Workspace::openCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->sessions.size();
}

auto Workspace::renameCollection(std::filesystem::path const& dir, std::string const& newName)
        -> Expected<std::filesystem::path> {
    if (this->session(dir))
        return std::unexpected(Error{Error::Code::InvalidOperation, "Close " + dir.string() + " before renaming it"});
    return Persist::renameCollection(this->normalize(dir), newName, this->options.sync.fsyncData);
}

auto Workspace::deleteCollection(std::filesystem::path const& dir) -> Expected<void> {
    if (this->session(dir))
        return std::unexpected(Error{Error::Code::InvalidOperation, "Close " + dir.string() + " before deleting it"});
    return Persist::deleteCollection(this->normalize(dir));
}

auto Workspace::closeSession(std::shared_ptr<CollectionSession> const& session, CloseMode mode) -> Expected<void> {
    session->sync().waitIdle();
    if (mode == CloseMode::Discard) {
        // The session can outlive its registration; its store must be clean.
        if (auto discarded = session->sync().discard(); !discarded)
            return discarded;
        rs_log("Closing " + session->dir().string() + " without saving", "Workspace");
        return {};
    }

    auto report = session->sync().flush();
    if (!report)
        return std::unexpected(report.error());
    if (!report->ok()) {
        auto const& failure = report->failures.front();
        return std::unexpected(Error{failure.error.code,
                                     "Unsaved changes in " + session->dir().string() + ": "
                                             + failure.error.message.value_or(std::string{})});
    }
    rs_log("Closed " + session->dir().string(), "Workspace");
    return {};
}

auto Workspace::close(std::filesystem::path const& dir, CloseMode mode) -> Expected<void> {
    auto session = this->session(dir);
    if (!session)
        return std::unexpected(Error{Error::Code::NotFound, dir.string() + " is not open"});
    if (auto closed = this->closeSession(session, mode); !closed)
        return closed;

    std::lock_guard<std::mutex> lock(this->mutex);
    this->sessions.erase(session->dir());
    return {};
}

auto Workspace::tick(std::chrono::steady_clock::time_point now) -> std::size_t {
    std::vector<std::shared_ptr<CollectionSession>> current;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& [dir, session] : this->sessions)
            current.push_back(session);
    }
    std::size_t scheduled = 0;
    for (auto const& session : current) {
        if (session->sync().tick(now))
            ++scheduled;
    }
    return scheduled;
}

auto Workspace::shutdown() -> Expected<void> {
    std::vector<std::shared_ptr<CollectionSession>> current;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& [dir, session] : this->sessions)
            current.push_back(session);
    }

    std::optional<Error> firstFailure;
    for (auto const& session : current) {
        auto closed = this->closeSession(session, CloseMode::Flush);
        if (!closed) {
            rs_log("Shutdown could not save " + session->dir().string(), "Workspace", "Error");
            if (!firstFailure)
                firstFailure = closed.error();
            continue;
        }
        std::lock_guard<std::mutex> lock(this->mutex);
        this->sessions.erase(session->dir());
    }
    this->worker->shutdown();

    if (firstFailure)
        return std::unexpected(*firstFailure);
    return {};
}

} // namespace RS::App
