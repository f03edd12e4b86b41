#pragma once

#include "core/Error.hpp"
#include "persist/CollectionLayout.hpp"
#include "tree/Node.hpp"

#include <memory>
#include <string>
#include <vector>

namespace RS::Persist {

struct LoadedCollection {
    Tree::CollectionInfo        info;
    std::unique_ptr<Tree::Node> root;
    // Request files on disk that the manifest does not reference.
    std::vector<std::string> orphanKeys;
};

// Reads the manifest and every request file it references. Fails with NotFound
// when the directory holds no manifest and with MalformedInput when any file
// does not decode or the assembled tree is inconsistent.
[[nodiscard]] auto loadCollection(CollectionLayout const& layout) -> Expected<LoadedCollection>;

// Writes every request file below `root`, then the manifest.
[[nodiscard]] auto writeCollection(CollectionLayout const&     layout,
                                   Tree::CollectionInfo const& info,
                                   Tree::Node const&           root,
                                   bool                        fsyncData) -> Expected<void>;

} // namespace RS::Persist
