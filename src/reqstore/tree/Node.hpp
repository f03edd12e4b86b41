#pragma once

#include "tree/RequestMethod.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RS::Tree {

using NodeId = std::uint64_t;

inline constexpr NodeId InvalidNodeId = 0;

enum class NodeKind {
    Directory,
    Request
};

struct HeaderEntry {
    std::string name;
    std::string value;
    bool        enabled = true;

    auto operator==(HeaderEntry const&) const -> bool = default;
};

// Example of what the endpoint may answer, kept with the request definition.
struct SampleResponse {
    std::string                                      name;
    std::optional<std::uint16_t>                     status;
    std::string                                      body;
    std::vector<std::pair<std::string, std::string>> headers;

    auto operator==(SampleResponse const&) const -> bool = default;
};

// Persisted definition of a request.
struct RequestData {
    RequestMethod               method   = RequestMethod::Get;
    std::string                 url;
    std::vector<HeaderEntry>    headers;
    std::string                 body;
    BodyKind                    bodyKind = BodyKind::NoBody;
    AuthKind                    auth     = AuthKind::None;
    std::vector<SampleResponse> sampleResponses;

    auto operator==(RequestData const&) const -> bool = default;
};

struct CollectionInfo {
    std::string name;
    std::string description;

    auto operator==(CollectionInfo const&) const -> bool = default;
};

// Outcome of the last execution, cached for display only.
struct ResponseSummary {
    std::uint16_t                                    status    = 0;
    std::size_t                                      sizeBytes = 0;
    std::chrono::milliseconds                        duration{0};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string                                      body;
};

/**
 * Node of a collection tree.
 *
 * A single structure represents both variants; `kind` decides which members
 * are meaningful:
 * - Directory: `children` holds the owned, ordered sub-tree.
 * - Request: `request` holds the definition, `lastResponse` the cached result.
 *
 * `parent` is a non-owning back-reference maintained by CollectionTree. It is
 * null for the root and for detached nodes.
 */
struct Node final {
    NodeId      id   = InvalidNodeId;
    NodeKind    kind = NodeKind::Directory;
    std::string key;
    std::string name;
    Node*       parent = nullptr;

    std::vector<std::unique_ptr<Node>> children;

    RequestData                    request;
    std::optional<ResponseSummary> lastResponse;

    [[nodiscard]] auto isDirectory() const noexcept -> bool { return kind == NodeKind::Directory; }
    [[nodiscard]] auto isRequest() const noexcept -> bool { return kind == NodeKind::Request; }

    [[nodiscard]] auto findChild(std::string_view childName) const -> Node*;
    [[nodiscard]] auto indexOf(Node const* child) const -> std::optional<std::size_t>;

    static auto makeDirectory(std::string name, std::string key = {}) -> std::unique_ptr<Node>;
    static auto makeRequest(std::string name, RequestMethod method = RequestMethod::Get, std::string key = {})
        -> std::unique_ptr<Node>;
};

[[nodiscard]] auto nodeKindToString(NodeKind kind) -> std::string_view;

// Checks a freshly built tree: non-empty unique sibling names, children only
// under directories, well formed unique keys.
[[nodiscard]] auto validateTree(Node const& root) -> Expected<void>;

// 128 random bits as 32 lowercase hex characters.
[[nodiscard]] auto generateNodeKey() -> std::string;
[[nodiscard]] auto isValidNodeKey(std::string_view key) noexcept -> bool;

// Well formed UTF-8: no overlong forms, surrogates or code points above U+10FFFF.
[[nodiscard]] auto isValidUtf8(std::string_view text) noexcept -> bool;

} // namespace RS::Tree
