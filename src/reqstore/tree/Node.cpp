#include "tree/Node.hpp"

#include <parallel_hashmap/phmap.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace RS::Tree {

auto Node::findChild(std::string_view childName) const -> Node* {
    for (auto const& child : children) {
        if (child->name == childName)
            return child.get();
    }
    return nullptr;
}

auto Node::indexOf(Node const* child) const -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (children[i].get() == child)
            return i;
    }
    return std::nullopt;
}

auto Node::makeDirectory(std::string name, std::string key) -> std::unique_ptr<Node> {
    auto node  = std::make_unique<Node>();
    node->kind = NodeKind::Directory;
    node->name = std::move(name);
    node->key  = key.empty() ? generateNodeKey() : std::move(key);
    return node;
}

auto Node::makeRequest(std::string name, RequestMethod method, std::string key) -> std::unique_ptr<Node> {
    auto node            = std::make_unique<Node>();
    node->kind           = NodeKind::Request;
    node->name           = std::move(name);
    node->key            = key.empty() ? generateNodeKey() : std::move(key);
    node->request.method = method;
    return node;
}

auto nodeKindToString(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Directory:
        return "directory";
    case NodeKind::Request:
        return "request";
    }
    return "directory";
}

auto validateTree(Node const& root) -> Expected<void> {
    phmap::flat_hash_set<std::string> keys;
    std::vector<Node const*>          pending{&root};
    while (!pending.empty()) {
        Node const* node = pending.back();
        pending.pop_back();
        if (!isValidNodeKey(node->key))
            return std::unexpected(Error{Error::Code::MalformedInput, "Invalid node key '" + node->key + "'"});
        if (!keys.insert(node->key).second)
            return std::unexpected(Error{Error::Code::MalformedInput, "Duplicate node key '" + node->key + "'"});
        if (node->isRequest() && !node->children.empty())
            return std::unexpected(Error{Error::Code::MalformedInput, "Request '" + node->name + "' has children"});

        phmap::flat_hash_set<std::string_view> names;
        for (auto const& child : node->children) {
            if (child->name.empty())
                return std::unexpected(Error{Error::Code::InvalidName, "Empty name below '" + node->name + "'"});
            if (!names.insert(child->name).second)
                return std::unexpected(
                        Error{Error::Code::NameCollision, "Duplicate name '" + child->name + "' below '" + node->name + "'"});
            pending.push_back(child.get());
        }
    }
    return {};
}

auto generateNodeKey() -> std::string {
    thread_local std::mt19937_64                 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    auto                                         high = dist(engine);
    auto                                         low  = dist(engine);
    std::ostringstream                           oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

auto isValidNodeKey(std::string_view key) noexcept -> bool {
    if (key.size() != 32)
        return false;
    for (char c : key) {
        bool digit = c >= '0' && c <= '9';
        bool hex   = c >= 'a' && c <= 'f';
        if (!digit && !hex)
            return false;
    }
    return true;
}

auto isValidUtf8(std::string_view text) noexcept -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        auto const lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t   length = 0;
        std::uint32_t code   = 0;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
            code   = lead & 0x1Fu;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            code   = lead & 0x0Fu;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            code   = lead & 0x07u;
        } else {
            return false;
        }
        if (text.size() - i < length)
            return false;
        for (std::size_t k = 1; k < length; ++k) {
            auto const next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0u) != 0x80u)
                return false;
            code = (code << 6) | (next & 0x3Fu);
        }
        if (length == 3 && (code < 0x800 || (code >= 0xD800 && code <= 0xDFFF)))
            return false;
        if (length == 4 && (code < 0x10000 || code > 0x10FFFF))
            return false;
        i += length;
    }
    return true;
}

} // namespace RS::Tree
