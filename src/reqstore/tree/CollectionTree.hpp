#pragma once

#include "core/Error.hpp"
#include "tree/Node.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RS::Tree {

/**
 * Lazy pre-order walk over a subtree.
 *
 * The range only stores its starting node, so iterating it again restarts the
 * walk from scratch. Iterators are invalidated by any structural change to the
 * tree they walk.
 */
class SubtreeRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Node;
        using difference_type   = std::ptrdiff_t;
        using pointer           = Node const*;
        using reference         = Node const&;

        Iterator() = default;
        explicit Iterator(Node const* start);

        auto operator*() const -> reference { return *this->stack.back(); }
        auto operator->() const -> pointer { return this->stack.back(); }
        auto operator++() -> Iterator&;
        auto operator++(int) -> Iterator;
        auto operator==(Iterator const& other) const -> bool;

    private:
        std::vector<Node const*> stack;
    };

    SubtreeRange() = default;
    explicit SubtreeRange(Node const* start)
        : start(start) {}

    [[nodiscard]] auto begin() const -> Iterator { return Iterator{this->start}; }
    [[nodiscard]] auto end() const -> Iterator { return Iterator{}; }
    [[nodiscard]] auto empty() const -> bool { return this->start == nullptr; }

private:
    Node const* start = nullptr;
};

/**
 * Owning tree of one collection plus an id index.
 *
 * Every node reachable from the root is indexed by its id. Ids come from a
 * monotonic counter and are never handed out twice by the same tree, even
 * after the root is replaced.
 */
class CollectionTree {
public:
    CollectionTree();
    explicit CollectionTree(std::unique_ptr<Node> root);

    CollectionTree(CollectionTree const&)                    = delete;
    auto operator=(CollectionTree const&) -> CollectionTree& = delete;

    [[nodiscard]] auto root() -> Node& { return *this->rootNode; }
    [[nodiscard]] auto root() const -> Node const& { return *this->rootNode; }
    [[nodiscard]] auto rootId() const -> NodeId { return this->rootNode->id; }

    [[nodiscard]] auto find(NodeId id) -> Node*;
    [[nodiscard]] auto find(NodeId id) const -> Node const*;

    // Names from below the root down to the node; the root itself maps to an empty path.
    [[nodiscard]] auto pathOf(NodeId id) const -> Expected<std::vector<std::string>>;

    // Empty range when the id is unknown.
    [[nodiscard]] auto subtree(NodeId id) const -> SubtreeRange;

    // True when `id` lies strictly below `ancestor`.
    [[nodiscard]] auto isDescendant(NodeId ancestor, NodeId id) const -> bool;
    [[nodiscard]] auto childIndex(NodeId id) const -> std::optional<std::size_t>;
    [[nodiscard]] auto size() const -> std::size_t { return this->index.size(); }

    // Structural primitives. Callers validate; these only keep the index and
    // parent pointers consistent.
    auto attach(Node& parent, std::unique_ptr<Node> child, std::optional<std::size_t> position = std::nullopt) -> Node&;
    auto detach(Node& node) -> std::unique_ptr<Node>;
    auto adoptRoot(std::unique_ptr<Node> newRoot) -> void;

    [[nodiscard]] auto peekNextId() const -> NodeId { return this->nextId; }

private:
    auto allocateId() -> NodeId;
    auto indexSubtree(Node& node) -> void;
    auto unindexSubtree(Node const& node) -> void;

    std::unique_ptr<Node>                   rootNode;
    phmap::flat_hash_map<NodeId, Node*>     index;
    NodeId                                  nextId = 1;
};

} // namespace RS::Tree
