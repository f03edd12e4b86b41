#pragma once

#include "core/Error.hpp"
#include "tree/Node.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace RS::Codec {

inline constexpr int FormatVersion = 1;

// Structure entry of the manifest. Requests carry only their key; their
// content lives in a file of their own.
struct ManifestEntry {
    Tree::NodeKind             kind = Tree::NodeKind::Directory;
    std::string                key;
    std::string                name;
    std::vector<ManifestEntry> children;
};

struct Manifest {
    Tree::CollectionInfo info;
    ManifestEntry        root;
};

// Self-contained collection with requests inline.
struct Document {
    Tree::CollectionInfo        info;
    std::unique_ptr<Tree::Node> root;
};

// Encoders are deterministic: sorted object keys, two space indentation,
// trailing newline. Cached responses and ids are never written.
[[nodiscard]] auto encodeRequest(Tree::Node const& request) -> std::string;
[[nodiscard]] auto encodeManifest(Tree::CollectionInfo const& info, Tree::Node const& root) -> std::string;
[[nodiscard]] auto encodeDocument(Tree::CollectionInfo const& info, Tree::Node const& root) -> std::string;

// Decoders fail with MalformedInput naming the byte offset of a syntax error or
// the JSON pointer of a schema error. Returned nodes carry no ids.
[[nodiscard]] auto decodeRequest(std::string_view bytes) -> Expected<std::unique_ptr<Tree::Node>>;
[[nodiscard]] auto decodeManifest(std::string_view bytes) -> Expected<Manifest>;
[[nodiscard]] auto decodeDocument(std::string_view bytes) -> Expected<Document>;

} // namespace RS::Codec
