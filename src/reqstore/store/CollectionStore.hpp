#pragma once

#include "config/Options.hpp"
#include "core/Error.hpp"
#include "store/RequestUpdate.hpp"
#include "tree/CollectionTree.hpp"

#include <parallel_hashmap/phmap.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace RS::Store {

// Immutable copy of a request handed to the HTTP executor.
struct RequestSnapshot {
    Tree::NodeId      id = Tree::InvalidNodeId;
    std::string       name;
    Tree::RequestData data;
};

struct FlushEncoders {
    std::function<std::string(Tree::Node const&)>                             request;
    std::function<std::string(Tree::CollectionInfo const&, Tree::Node const&)> manifest;
};

// Bytes captured under the collection lock at the start of a flush.
struct FlushSnapshot {
    struct RequestWrite {
        Tree::NodeId id = Tree::InvalidNodeId;
        std::string  key;
        std::string  bytes;
    };

    std::vector<RequestWrite>  requests;
    std::optional<std::string> manifest;
    std::vector<Tree::NodeId>  directories;
    std::vector<std::string>   removals;

    [[nodiscard]] auto empty() const -> bool { return requests.empty() && !manifest && removals.empty(); }
};

struct FlushOutcome {
    std::vector<Tree::NodeId> failedRequests;
    bool                      manifestWritten = false;
    std::vector<std::string>  unremovedKeys;
};

/**
 * Sole mutation surface of one open collection.
 *
 * Owns the tree, the collection info, the dirty set and the queue of request
 * keys whose files must be removed. Every public call serializes on the
 * collection lock and fails with Error::Code::Timeout when the lock cannot be
 * taken within StoreOptions::lockTimeout. Mutations validate before touching
 * the tree, so a failed call leaves everything unchanged.
 *
 * The dirty set holds request ids whose file must be rewritten and directory
 * ids whose change requires a manifest rewrite.
 */
class CollectionStore {
public:
    explicit CollectionStore(StoreOptions options = {});
    CollectionStore(std::unique_ptr<Tree::Node> root,
                    Tree::CollectionInfo        info,
                    StoreOptions                options         = {},
                    std::vector<std::string>    pendingRemovals = {});

    CollectionStore(CollectionStore const&)                    = delete;
    auto operator=(CollectionStore const&) -> CollectionStore& = delete;

    [[nodiscard]] auto createNode(Tree::NodeId parentId, Tree::NodeKind kind, std::string name)
            -> Expected<Tree::NodeId>;
    [[nodiscard]] auto renameNode(Tree::NodeId id, std::string newName) -> Expected<void>;
    [[nodiscard]] auto moveNode(Tree::NodeId id, Tree::NodeId newParentId, std::optional<std::size_t> position = std::nullopt)
            -> Expected<void>;
    [[nodiscard]] auto deleteNode(Tree::NodeId id) -> Expected<void>;
    [[nodiscard]] auto updateRequest(Tree::NodeId id, RequestUpdate const& update) -> Expected<UpdateOutcome>;
    [[nodiscard]] auto setInfo(std::string name, std::string description) -> Expected<void>;

    [[nodiscard]] auto isDirty(Tree::NodeId id) const -> Expected<bool>;
    [[nodiscard]] auto anyDirty() const -> Expected<bool>;
    [[nodiscard]] auto dirtyIds() const -> Expected<std::vector<Tree::NodeId>>;
    [[nodiscard]] auto hasPendingWork() const -> Expected<bool>;

    [[nodiscard]] auto rootId() const -> Expected<Tree::NodeId>;
    [[nodiscard]] auto info() const -> Expected<Tree::CollectionInfo>;
    [[nodiscard]] auto requestSnapshot(Tree::NodeId id) const -> Expected<RequestSnapshot>;
    [[nodiscard]] auto attachResponse(Tree::NodeId id, Tree::ResponseSummary response) -> Expected<void>;
    [[nodiscard]] auto lastResponse(Tree::NodeId id) const -> Expected<std::optional<Tree::ResponseSummary>>;

    // Read-only access for rendering; `fn` runs under the collection lock.
    template <typename Fn>
    auto withTree(Fn&& fn) const -> Expected<std::invoke_result_t<Fn, Tree::CollectionTree const&>>;

    // Flush support for the synchronizer.
    [[nodiscard]] auto takeFlushSnapshot(FlushEncoders const& encoders) -> Expected<FlushSnapshot>;
    // Returns true when work is still pending afterwards. Waits for the lock
    // without a timeout so the outcome of written files is never dropped.
    auto reconcileFlush(FlushSnapshot const& snapshot, FlushOutcome const& outcome) -> bool;
    // Replaces the whole state, clearing the dirty set and pending removals.
    auto replaceContents(std::unique_ptr<Tree::Node> root, Tree::CollectionInfo info, std::vector<std::string> removals)
            -> void;

private:
    using Lock = std::unique_lock<std::timed_mutex>;

    [[nodiscard]] auto acquire() const -> Expected<Lock>;
    [[nodiscard]] auto lookup(Tree::NodeId id) const -> Expected<Tree::Node const*>;
    [[nodiscard]] auto requireNode(Tree::NodeId id) -> Expected<Tree::Node*>;
    [[nodiscard]] auto requireRequest(Tree::NodeId id) -> Expected<Tree::Node*>;
    [[nodiscard]] auto requireDirectory(Tree::NodeId id) -> Expected<Tree::Node*>;

    auto markDirty(Tree::NodeId id) -> void;
    auto pendingLocked() const -> bool;

    StoreOptions                       options;
    mutable std::timed_mutex           mutex;
    Tree::CollectionTree               tree;
    Tree::CollectionInfo               collectionInfo;
    phmap::flat_hash_set<Tree::NodeId> dirty;
    std::vector<std::string>           pendingRemovals;
};

template <typename Fn>
auto CollectionStore::withTree(Fn&& fn) const -> Expected<std::invoke_result_t<Fn, Tree::CollectionTree const&>> {
    using Result = std::invoke_result_t<Fn, Tree::CollectionTree const&>;
    auto lock    = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    Tree::CollectionTree const& view = this->tree;
    if constexpr (std::is_void_v<Result>) {
        std::invoke(std::forward<Fn>(fn), view);
        return {};
    } else {
        return std::invoke(std::forward<Fn>(fn), view);
    }
}

} // namespace RS::Store
