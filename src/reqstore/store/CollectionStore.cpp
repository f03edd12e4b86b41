#include "store/CollectionStore.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace RS::Store {

namespace {

auto indexOutOfRange(std::string const& what, std::size_t index, std::size_t size) -> Error {
    return Error{Error::Code::OutOfRange,
                 what + " index " + std::to_string(index) + " out of range (" + std::to_string(size) + ")"};
}

// Persisted text must survive a JSON round trip unchanged.
auto requireUtf8(std::string_view text, std::string const& field) -> Expected<void> {
    if (!Tree::isValidUtf8(text))
        return std::unexpected(Error{Error::Code::MalformedInput, field + " is not valid UTF-8"});
    return {};
}

auto requireName(std::string_view name, std::string const& what) -> Expected<void> {
    if (name.empty())
        return std::unexpected(Error{Error::Code::InvalidName, what + " must not be empty"});
    if (!Tree::isValidUtf8(name))
        return std::unexpected(Error{Error::Code::InvalidName, what + " is not valid UTF-8"});
    return {};
}

// Applies one update to a working copy of the request definition.
struct UpdateApplier {
    Tree::RequestData& data;

    auto operator()(SetMethod const& update) -> Expected<void> {
        data.method = update.method;
        return {};
    }
    auto operator()(SetUrl const& update) -> Expected<void> {
        if (auto valid = requireUtf8(update.url, "URL"); !valid)
            return valid;
        data.url = update.url;
        return {};
    }
    auto operator()(SetBody const& update) -> Expected<void> {
        if (auto valid = requireUtf8(update.body, "Body"); !valid)
            return valid;
        data.body = update.body;
        return {};
    }
    auto operator()(SetBodyKind const& update) -> Expected<void> {
        data.bodyKind = update.kind;
        return {};
    }
    auto operator()(SetAuth const& update) -> Expected<void> {
        data.auth = update.auth;
        return {};
    }
    auto operator()(AddHeader const& update) -> Expected<void> {
        if (auto valid = requireName(update.name, "Header name"); !valid)
            return valid;
        if (auto valid = requireUtf8(update.value, "Header value"); !valid)
            return valid;
        data.headers.push_back(Tree::HeaderEntry{update.name, update.value, update.enabled});
        return {};
    }
    auto operator()(UpdateHeader const& update) -> Expected<void> {
        if (update.index >= data.headers.size())
            return std::unexpected(indexOutOfRange("Header", update.index, data.headers.size()));
        if (auto valid = requireName(update.name, "Header name"); !valid)
            return valid;
        if (auto valid = requireUtf8(update.value, "Header value"); !valid)
            return valid;
        data.headers[update.index].name  = update.name;
        data.headers[update.index].value = update.value;
        return {};
    }
    auto operator()(RemoveHeader const& update) -> Expected<void> {
        if (update.index >= data.headers.size())
            return std::unexpected(indexOutOfRange("Header", update.index, data.headers.size()));
        data.headers.erase(data.headers.begin() + static_cast<std::ptrdiff_t>(update.index));
        return {};
    }
    auto operator()(SetHeaderEnabled const& update) -> Expected<void> {
        if (update.index >= data.headers.size())
            return std::unexpected(indexOutOfRange("Header", update.index, data.headers.size()));
        data.headers[update.index].enabled = update.enabled;
        return {};
    }
    auto operator()(AddSampleResponse const& update) -> Expected<void> {
        auto const& response = update.response;
        if (auto valid = requireName(response.name, "Sample response name"); !valid)
            return valid;
        if (auto valid = requireUtf8(response.body, "Sample response body"); !valid)
            return valid;
        for (auto const& [name, value] : response.headers) {
            if (auto valid = requireName(name, "Sample response header name"); !valid)
                return valid;
            if (auto valid = requireUtf8(value, "Sample response header value"); !valid)
                return valid;
        }
        data.sampleResponses.push_back(response);
        return {};
    }
    auto operator()(RemoveSampleResponse const& update) -> Expected<void> {
        if (update.index >= data.sampleResponses.size())
            return std::unexpected(indexOutOfRange("Sample response", update.index, data.sampleResponses.size()));
        data.sampleResponses.erase(data.sampleResponses.begin() + static_cast<std::ptrdiff_t>(update.index));
        return {};
    }
};

} // namespace

CollectionStore::CollectionStore(StoreOptions options)
    : options(options) {}

CollectionStore::CollectionStore(std::unique_ptr<Tree::Node> root,
                                 Tree::CollectionInfo        info,
                                 StoreOptions                options,
                                 std::vector<std::string>    pendingRemovals)
    : options(options),
      tree(std::move(root)),
      collectionInfo(std::move(info)),
      pendingRemovals(std::move(pendingRemovals)) {}

auto CollectionStore::acquire() const -> Expected<Lock> {
    Lock lock(this->mutex, std::defer_lock);
    if (!lock.try_lock_for(this->options.lockTimeout)) {
        rs_log("Collection lock busy", "Store", "Error");
        return std::unexpected(Error{Error::Code::Timeout, "Collection is busy, try again"});
    }
    return Expected<Lock>{std::move(lock)};
}

auto CollectionStore::lookup(Tree::NodeId id) const -> Expected<Tree::Node const*> {
    Tree::Node const* node = this->tree.find(id);
    if (node == nullptr)
        return std::unexpected(Error{Error::Code::NotFound, "No node with id " + std::to_string(id)});
    return node;
}

auto CollectionStore::requireNode(Tree::NodeId id) -> Expected<Tree::Node*> {
    Tree::Node* node = this->tree.find(id);
    if (node == nullptr)
        return std::unexpected(Error{Error::Code::NotFound, "No node with id " + std::to_string(id)});
    return node;
}

auto CollectionStore::requireRequest(Tree::NodeId id) -> Expected<Tree::Node*> {
    auto node = this->requireNode(id);
    if (!node)
        return node;
    if (!(*node)->isRequest())
        return std::unexpected(Error{Error::Code::TypeMismatch, "'" + (*node)->name + "' is not a request"});
    return node;
}

auto CollectionStore::requireDirectory(Tree::NodeId id) -> Expected<Tree::Node*> {
    auto node = this->requireNode(id);
    if (!node)
        return node;
    if (!(*node)->isDirectory())
        return std::unexpected(Error{Error::Code::InvalidParent, "'" + (*node)->name + "' is not a directory"});
    return node;
}

auto CollectionStore::markDirty(Tree::NodeId id) -> void {
    this->dirty.insert(id);
}

auto CollectionStore::pendingLocked() const -> bool {
    return !this->dirty.empty() || !this->pendingRemovals.empty();
}

auto CollectionStore::createNode(Tree::NodeId parentId, Tree::NodeKind kind, std::string name) -> Expected<Tree::NodeId> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());

    auto parent = this->requireDirectory(parentId);
    if (!parent)
        return std::unexpected(parent.error());
    if (auto valid = requireName(name, "Name"); !valid)
        return std::unexpected(valid.error());
    if ((*parent)->findChild(name) != nullptr)
        return std::unexpected(Error{Error::Code::NameCollision, "'" + name + "' already exists in '" + (*parent)->name + "'"});

    auto  node  = kind == Tree::NodeKind::Directory ? Tree::Node::makeDirectory(std::move(name))
                                                    : Tree::Node::makeRequest(std::move(name));
    auto& added = this->tree.attach(**parent, std::move(node));
    this->markDirty(added.id);
    this->markDirty(parentId);
    rs_log("Created " + std::string(Tree::nodeKindToString(kind)) + " '" + added.name + "' id " + std::to_string(added.id),
           "Store");
    return added.id;
}

auto CollectionStore::renameNode(Tree::NodeId id, std::string newName) -> Expected<void> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());

    auto node = this->requireNode(id);
    if (!node)
        return std::unexpected(node.error());
    Tree::Node& target = **node;
    if (target.parent == nullptr)
        return std::unexpected(Error{Error::Code::InvalidOperation, "The root directory cannot be renamed"});
    if (auto valid = requireName(newName, "Name"); !valid)
        return valid;
    if (newName == target.name)
        return {};
    if (target.parent->findChild(newName) != nullptr)
        return std::unexpected(
                Error{Error::Code::NameCollision, "'" + newName + "' already exists in '" + target.parent->name + "'"});

    rs_log("Renamed '" + target.name + "' to '" + newName + "'", "Store");
    target.name = std::move(newName);
    this->markDirty(id);
    return {};
}

auto CollectionStore::moveNode(Tree::NodeId id, Tree::NodeId newParentId, std::optional<std::size_t> position)
        -> Expected<void> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());

    auto node = this->requireNode(id);
    if (!node)
        return std::unexpected(node.error());
    Tree::Node& moving = **node;
    if (moving.parent == nullptr)
        return std::unexpected(Error{Error::Code::InvalidOperation, "The root directory cannot be moved"});

    auto newParent = this->requireDirectory(newParentId);
    if (!newParent)
        return std::unexpected(newParent.error());
    if (newParentId == id || this->tree.isDescendant(id, newParentId))
        return std::unexpected(
                Error{Error::Code::CyclicMove, "Cannot move '" + moving.name + "' into itself or one of its descendants"});

    Tree::Node& oldParent  = *moving.parent;
    Tree::Node& destParent = **newParent;
    bool const  sameParent = &oldParent == &destParent;
    if (!sameParent && destParent.findChild(moving.name) != nullptr)
        return std::unexpected(
                Error{Error::Code::NameCollision, "'" + moving.name + "' already exists in '" + destParent.name + "'"});

    std::size_t const slots = sameParent ? destParent.children.size() - 1 : destParent.children.size();
    if (position && *position > slots)
        return std::unexpected(Error{Error::Code::OutOfRange,
                                     "Position " + std::to_string(*position) + " out of range (" + std::to_string(slots)
                                             + " slots)"});
    std::size_t const target = position.value_or(slots);
    if (sameParent && oldParent.indexOf(&moving) == target)
        return {};

    auto owned = this->tree.detach(moving);
    this->tree.attach(destParent, std::move(owned), target);

    this->markDirty(oldParent.id);
    this->markDirty(destParent.id);
    for (Tree::Node const& member : this->tree.subtree(id))
        this->markDirty(member.id);
    rs_log("Moved '" + moving.name + "' to '" + destParent.name + "' at " + std::to_string(target), "Store");
    return {};
}

auto CollectionStore::deleteNode(Tree::NodeId id) -> Expected<void> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());

    auto node = this->requireNode(id);
    if (!node)
        return std::unexpected(node.error());
    Tree::Node& doomed = **node;
    if (doomed.parent == nullptr)
        return std::unexpected(Error{Error::Code::InvalidOperation, "The root directory cannot be deleted"});

    Tree::NodeId const parentId = doomed.parent->id;
    std::size_t        removed  = 0;
    for (Tree::Node const& member : this->tree.subtree(id)) {
        this->dirty.erase(member.id);
        if (member.isRequest())
            this->pendingRemovals.push_back(member.key);
        ++removed;
    }
    rs_log("Deleted '" + doomed.name + "' with " + std::to_string(removed) + " node(s)", "Store");
    auto detached = this->tree.detach(doomed);
    this->markDirty(parentId);
    return {};
}

auto CollectionStore::updateRequest(Tree::NodeId id, RequestUpdate const& update) -> Expected<UpdateOutcome> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());

    auto node = this->requireRequest(id);
    if (!node)
        return std::unexpected(node.error());
    Tree::Node& request = **node;

    Tree::RequestData working = request.request;
    if (auto applied = std::visit(UpdateApplier{working}, update); !applied)
        return std::unexpected(applied.error());

    UpdateOutcome outcome;
    outcome.bodyIgnoredByMethod = !working.body.empty() && !Tree::methodAllowsBody(working.method);
    if (working == request.request)
        return outcome;

    request.request = std::move(working);
    outcome.changed = true;
    this->markDirty(id);
    rs_log("Updated request '" + request.name + "'", "Store", "INFO");
    return outcome;
}

auto CollectionStore::setInfo(std::string name, std::string description) -> Expected<void> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    if (auto valid = requireName(name, "Collection name"); !valid)
        return valid;
    if (auto valid = requireUtf8(description, "Collection description"); !valid)
        return valid;

    Tree::CollectionInfo updated{std::move(name), std::move(description)};
    if (updated == this->collectionInfo)
        return {};
    this->collectionInfo = std::move(updated);
    this->markDirty(this->tree.rootId());
    return {};
}

auto CollectionStore::isDirty(Tree::NodeId id) const -> Expected<bool> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    if (auto node = this->lookup(id); !node)
        return std::unexpected(node.error());
    return this->dirty.contains(id);
}

auto CollectionStore::anyDirty() const -> Expected<bool> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    return !this->dirty.empty();
}

auto CollectionStore::dirtyIds() const -> Expected<std::vector<Tree::NodeId>> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    std::vector<Tree::NodeId> ids(this->dirty.begin(), this->dirty.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto CollectionStore::hasPendingWork() const -> Expected<bool> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    return this->pendingLocked();
}

auto CollectionStore::rootId() const -> Expected<Tree::NodeId> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    return this->tree.rootId();
}

auto CollectionStore::info() const -> Expected<Tree::CollectionInfo> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    return this->collectionInfo;
}

auto CollectionStore::requestSnapshot(Tree::NodeId id) const -> Expected<RequestSnapshot> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    auto node = this->lookup(id);
    if (!node)
        return std::unexpected(node.error());
    if (!(*node)->isRequest())
        return std::unexpected(Error{Error::Code::TypeMismatch, "'" + (*node)->name + "' is not a request"});
    return RequestSnapshot{.id = id, .name = (*node)->name, .data = (*node)->request};
}

auto CollectionStore::attachResponse(Tree::NodeId id, Tree::ResponseSummary response) -> Expected<void> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    auto node = this->requireRequest(id);
    if (!node)
        return std::unexpected(node.error());
    (*node)->lastResponse = std::move(response);
    return {};
}

auto CollectionStore::lastResponse(Tree::NodeId id) const -> Expected<std::optional<Tree::ResponseSummary>> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());
    auto node = this->lookup(id);
    if (!node)
        return std::unexpected(node.error());
    if (!(*node)->isRequest())
        return std::unexpected(Error{Error::Code::TypeMismatch, "'" + (*node)->name + "' is not a request"});
    return (*node)->lastResponse;
}

auto CollectionStore::takeFlushSnapshot(FlushEncoders const& encoders) -> Expected<FlushSnapshot> {
    auto lock = this->acquire();
    if (!lock)
        return std::unexpected(lock.error());

    FlushSnapshot snapshot;
    if (!this->pendingLocked())
        return snapshot;

    std::vector<Tree::NodeId> ids(this->dirty.begin(), this->dirty.end());
    std::sort(ids.begin(), ids.end());
    for (auto id : ids) {
        Tree::Node const* node = this->tree.find(id);
        if (node == nullptr)
            continue;
        if (node->isRequest())
            snapshot.requests.push_back({.id = id, .key = node->key, .bytes = encoders.request(*node)});
        else
            snapshot.directories.push_back(id);
    }
    if (!snapshot.directories.empty())
        snapshot.manifest = encoders.manifest(this->collectionInfo, this->tree.root());
    snapshot.removals = std::move(this->pendingRemovals);
    this->pendingRemovals.clear();
    this->dirty.clear();

    rs_log("Flush snapshot: " + std::to_string(snapshot.requests.size()) + " request(s), manifest "
                   + (snapshot.manifest ? "yes" : "no") + ", " + std::to_string(snapshot.removals.size())
                   + " removal(s)",
           "Store", "Sync");
    return snapshot;
}

auto CollectionStore::reconcileFlush(FlushSnapshot const& snapshot, FlushOutcome const& outcome) -> bool {
    std::lock_guard<std::timed_mutex> lock(this->mutex);

    for (auto id : outcome.failedRequests) {
        if (this->tree.find(id) != nullptr)
            this->markDirty(id);
    }
    if (snapshot.manifest && !outcome.manifestWritten) {
        bool restored = false;
        for (auto id : snapshot.directories) {
            if (this->tree.find(id) != nullptr) {
                this->markDirty(id);
                restored = true;
            }
        }
        if (!restored)
            this->markDirty(this->tree.rootId());
    }
    this->pendingRemovals.insert(this->pendingRemovals.end(), outcome.unremovedKeys.begin(), outcome.unremovedKeys.end());
    return this->pendingLocked();
}

auto CollectionStore::replaceContents(std::unique_ptr<Tree::Node> root,
                                      Tree::CollectionInfo        info,
                                      std::vector<std::string>    removals) -> void {
    std::lock_guard<std::timed_mutex> lock(this->mutex);
    this->tree.adoptRoot(std::move(root));
    this->collectionInfo  = std::move(info);
    this->pendingRemovals = std::move(removals);
    this->dirty.clear();
}

} // namespace RS::Store
