#include "persist/CollectionLoader.hpp"

#include "codec/CollectionCodec.hpp"
#include "log/TaggedLogger.hpp"
#include "persist/FileUtils.hpp"
#include "tree/CollectionTree.hpp"

#include <parallel_hashmap/phmap.h>

namespace RS::Persist {

namespace {

auto assembleNode(Codec::ManifestEntry const&         entry,
                  CollectionLayout const&             layout,
                  phmap::flat_hash_set<std::string>&  referenced) -> Expected<std::unique_ptr<Tree::Node>> {
    if (entry.kind == Tree::NodeKind::Request) {
        auto path = layout.requestPath(entry.key);
        if (!path)
            return std::unexpected(path.error());
        auto text = readTextFile(*path);
        if (!text) {
            if (text.error().code == Error::Code::NotFound)
                return std::unexpected(Error{Error::Code::MalformedInput,
                                             "Manifest references missing request file " + path->string()});
            return std::unexpected(text.error());
        }
        auto node = Codec::decodeRequest(*text);
        if (!node)
            return std::unexpected(Error{Error::Code::MalformedInput, path->string() + ": " + *node.error().message});
        if ((*node)->key != entry.key)
            return std::unexpected(Error{Error::Code::MalformedInput, path->string() + ": key does not match file name"});
        referenced.insert(entry.key);
        return node;
    }

    auto directory = Tree::Node::makeDirectory(entry.name.empty() ? std::string{"root"} : entry.name, entry.key);
    for (auto const& childEntry : entry.children) {
        auto child = assembleNode(childEntry, layout, referenced);
        if (!child)
            return child;
        (*child)->parent = directory.get();
        directory->children.push_back(std::move(*child));
    }
    return directory;
}

} // namespace

auto loadCollection(CollectionLayout const& layout) -> Expected<LoadedCollection> {
    auto manifestText = readTextFile(layout.manifestPath());
    if (!manifestText)
        return std::unexpected(manifestText.error());
    auto manifest = Codec::decodeManifest(*manifestText);
    if (!manifest)
        return std::unexpected(
                Error{Error::Code::MalformedInput, layout.manifestPath().string() + ": " + *manifest.error().message});

    phmap::flat_hash_set<std::string> referenced;
    auto                              root = assembleNode(manifest->root, layout, referenced);
    if (!root)
        return std::unexpected(root.error());
    if (auto valid = Tree::validateTree(**root); !valid)
        return std::unexpected(Error{Error::Code::MalformedInput, layout.dir().string() + ": " + *valid.error().message});

    auto onDisk = layout.listRequestKeys();
    if (!onDisk)
        return std::unexpected(onDisk.error());

    LoadedCollection loaded{.info = std::move(manifest->info), .root = std::move(*root), .orphanKeys = {}};
    for (auto& key : *onDisk) {
        if (!referenced.contains(key))
            loaded.orphanKeys.push_back(std::move(key));
    }
    rs_log("Loaded " + layout.dir().string() + " with " + std::to_string(referenced.size()) + " request(s), "
                   + std::to_string(loaded.orphanKeys.size()) + " orphan(s)",
           "Persist");
    return loaded;
}

auto writeCollection(CollectionLayout const&     layout,
                     Tree::CollectionInfo const& info,
                     Tree::Node const&           root,
                     bool                        fsyncData) -> Expected<void> {
    for (Tree::Node const& node : Tree::SubtreeRange{&root}) {
        if (!node.isRequest())
            continue;
        auto path = layout.requestPath(node.key);
        if (!path)
            return std::unexpected(path.error());
        if (auto written = writeFileAtomic(*path, Codec::encodeRequest(node), fsyncData); !written)
            return written;
    }
    return writeFileAtomic(layout.manifestPath(), Codec::encodeManifest(info, root), fsyncData);
}

} // namespace RS::Persist
