#include "tree/CollectionTree.hpp"

#include <algorithm>

namespace RS::Tree {

SubtreeRange::Iterator::Iterator(Node const* start) {
    if (start != nullptr)
        this->stack.push_back(start);
}

auto SubtreeRange::Iterator::operator++() -> Iterator& {
    if (this->stack.empty())
        return *this;
    Node const* current = this->stack.back();
    this->stack.pop_back();
    for (auto it = current->children.rbegin(); it != current->children.rend(); ++it)
        this->stack.push_back(it->get());
    return *this;
}

auto SubtreeRange::Iterator::operator++(int) -> Iterator {
    Iterator copy = *this;
    ++(*this);
    return copy;
}

auto SubtreeRange::Iterator::operator==(Iterator const& other) const -> bool {
    return this->stack == other.stack;
}

CollectionTree::CollectionTree()
    : CollectionTree(Node::makeDirectory("root")) {}

CollectionTree::CollectionTree(std::unique_ptr<Node> root) {
    this->adoptRoot(std::move(root));
}

auto CollectionTree::find(NodeId id) -> Node* {
    auto it = this->index.find(id);
    return it == this->index.end() ? nullptr : it->second;
}

auto CollectionTree::find(NodeId id) const -> Node const* {
    auto it = this->index.find(id);
    return it == this->index.end() ? nullptr : it->second;
}

auto CollectionTree::pathOf(NodeId id) const -> Expected<std::vector<std::string>> {
    Node const* node = this->find(id);
    if (node == nullptr)
        return std::unexpected(Error{Error::Code::NotFound, "No node with id " + std::to_string(id)});

    std::vector<std::string> path;
    for (Node const* current = node; current->parent != nullptr; current = current->parent)
        path.push_back(current->name);
    std::reverse(path.begin(), path.end());
    return path;
}

auto CollectionTree::subtree(NodeId id) const -> SubtreeRange {
    return SubtreeRange{this->find(id)};
}

auto CollectionTree::isDescendant(NodeId ancestor, NodeId id) const -> bool {
    Node const* node = this->find(id);
    if (node == nullptr)
        return false;
    for (Node const* current = node->parent; current != nullptr; current = current->parent) {
        if (current->id == ancestor)
            return true;
    }
    return false;
}

auto CollectionTree::childIndex(NodeId id) const -> std::optional<std::size_t> {
    Node const* node = this->find(id);
    if (node == nullptr || node->parent == nullptr)
        return std::nullopt;
    return node->parent->indexOf(node);
}

auto CollectionTree::attach(Node& parent, std::unique_ptr<Node> child, std::optional<std::size_t> position) -> Node& {
    Node& ref   = *child;
    ref.parent  = &parent;
    auto offset = std::min(position.value_or(parent.children.size()), parent.children.size());
    parent.children.insert(parent.children.begin() + static_cast<std::ptrdiff_t>(offset), std::move(child));
    this->indexSubtree(ref);
    return ref;
}

auto CollectionTree::detach(Node& node) -> std::unique_ptr<Node> {
    Node* parent = node.parent;
    if (parent == nullptr)
        return nullptr;
    auto position = parent->indexOf(&node);
    if (!position)
        return nullptr;

    auto owned = std::move(parent->children[*position]);
    parent->children.erase(parent->children.begin() + static_cast<std::ptrdiff_t>(*position));
    owned->parent = nullptr;
    this->unindexSubtree(*owned);
    return owned;
}

auto CollectionTree::adoptRoot(std::unique_ptr<Node> newRoot) -> void {
    if (!newRoot)
        newRoot = Node::makeDirectory("root");
    this->index.clear();
    this->rootNode         = std::move(newRoot);
    this->rootNode->parent = nullptr;
    this->indexSubtree(*this->rootNode);
}

auto CollectionTree::allocateId() -> NodeId {
    return this->nextId++;
}

auto CollectionTree::indexSubtree(Node& node) -> void {
    std::vector<Node*> pending{&node};
    while (!pending.empty()) {
        Node* current = pending.back();
        pending.pop_back();
        if (current->id == InvalidNodeId)
            current->id = this->allocateId();
        this->index[current->id] = current;
        for (auto& child : current->children) {
            child->parent = current;
            pending.push_back(child.get());
        }
    }
}

auto CollectionTree::unindexSubtree(Node const& node) -> void {
    for (Node const& current : SubtreeRange{&node})
        this->index.erase(current.id);
}

} // namespace RS::Tree
