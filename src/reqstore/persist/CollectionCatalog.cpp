#include "persist/CollectionCatalog.hpp"

#include "codec/CollectionCodec.hpp"
#include "log/TaggedLogger.hpp"
#include "persist/CollectionLayout.hpp"
#include "persist/CollectionLoader.hpp"
#include "persist/FileUtils.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <system_error>

namespace RS::Persist {

namespace {

constexpr std::array<char, 11> ForbiddenFileNameChars{'/', '\\', '?', '%', '*', ':', '|', '"', '<', '>', '.'};

auto lastWriteTime(std::filesystem::path const& path) -> std::chrono::system_clock::time_point {
    std::error_code ec;
    auto            fileTime = std::filesystem::last_write_time(path, ec);
    if (ec)
        return {};
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(fileTime));
}

auto collectionDirFor(std::filesystem::path const& collectionsDir, std::string const& name)
        -> Expected<std::filesystem::path> {
    if (name.empty())
        return std::unexpected(Error{Error::Code::InvalidName, "Collection name must not be empty"});
    return collectionsDir / sanitizeFileName(name);
}

auto requireCollectionDir(std::filesystem::path const& collectionDir) -> Expected<void> {
    if (!CollectionLayout{collectionDir}.hasManifest())
        return std::unexpected(Error{Error::Code::InvalidPath, collectionDir.string() + " is not a collection"});
    return {};
}

auto requireVacant(std::filesystem::path const& dir) -> Expected<void> {
    std::error_code ec;
    if (std::filesystem::exists(dir, ec))
        return std::unexpected(Error{Error::Code::AlreadyExists, dir.string() + " already exists"});
    return {};
}

} // namespace

auto nextSorting(CollectionSorting sorting) -> CollectionSorting {
    switch (sorting) {
    case CollectionSorting::Recent:
        return CollectionSorting::Name;
    case CollectionSorting::Name:
        return CollectionSorting::Size;
    case CollectionSorting::Size:
        return CollectionSorting::Recent;
    }
    return CollectionSorting::Recent;
}

auto prevSorting(CollectionSorting sorting) -> CollectionSorting {
    switch (sorting) {
    case CollectionSorting::Recent:
        return CollectionSorting::Size;
    case CollectionSorting::Name:
        return CollectionSorting::Recent;
    case CollectionSorting::Size:
        return CollectionSorting::Name;
    }
    return CollectionSorting::Recent;
}

auto sortingToString(CollectionSorting sorting) -> std::string_view {
    switch (sorting) {
    case CollectionSorting::Recent:
        return "Most recent";
    case CollectionSorting::Name:
        return "Name";
    case CollectionSorting::Size:
        return "Size";
    }
    return "Most recent";
}

auto sortCollections(std::vector<CollectionMeta>& collections, CollectionSorting sorting) -> void {
    switch (sorting) {
    case CollectionSorting::Recent:
        std::stable_sort(collections.begin(), collections.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.modified > rhs.modified;
        });
        break;
    case CollectionSorting::Name:
        std::stable_sort(collections.begin(), collections.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.name < rhs.name;
        });
        break;
    case CollectionSorting::Size:
        std::stable_sort(collections.begin(), collections.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.sizeBytes > rhs.sizeBytes;
        });
        break;
    }
}

auto listCollections(std::filesystem::path const& collectionsDir, CollectionSorting sorting)
        -> Expected<std::vector<CollectionMeta>> {
    std::vector<CollectionMeta> collections;
    std::error_code             ec;
    if (!std::filesystem::exists(collectionsDir, ec))
        return collections;

    std::filesystem::directory_iterator it(collectionsDir, ec);
    if (ec)
        return std::unexpected(
                Error{Error::Code::IoFailure, "Failed to list " + collectionsDir.string() + ": " + ec.message()});
    for (std::filesystem::directory_iterator end; it != end;) {
        CollectionLayout layout{it->path()};
        if (layout.hasManifest()) {
            CollectionMeta meta;
            meta.path      = layout.dir();
            meta.name      = layout.dir().filename().string();
            meta.sizeBytes = directorySizeOrZero(layout.dir());
            meta.modified  = lastWriteTime(layout.manifestPath());
            if (auto text = readTextFile(layout.manifestPath())) {
                if (auto manifest = Codec::decodeManifest(*text); manifest && !manifest->info.name.empty())
                    meta.name = manifest->info.name;
            }
            collections.push_back(std::move(meta));
        }
        it.increment(ec);
        if (ec)
            return std::unexpected(
                    Error{Error::Code::IoFailure, "Failed to list " + collectionsDir.string() + ": " + ec.message()});
    }
    sortCollections(collections, sorting);
    return collections;
}

auto sanitizeFileName(std::string_view name) -> std::string {
    std::string sanitized{name};
    for (char& c : sanitized) {
        if (std::find(ForbiddenFileNameChars.begin(), ForbiddenFileNameChars.end(), c) != ForbiddenFileNameChars.end())
            c = '_';
    }
    return sanitized;
}

auto readableByteSize(std::uintmax_t bytes) -> std::string {
    constexpr std::array<char const*, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};
    double                               size      = static_cast<double>(bytes);
    std::size_t                          unitIndex = 0;
    while (size >= 1024.0 && unitIndex < units.size() - 1) {
        size /= 1024.0;
        ++unitIndex;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f%s", size, units[unitIndex]);
    return buffer;
}

auto createCollection(std::filesystem::path const& collectionsDir,
                      std::string const&           name,
                      std::string const&           description,
                      bool                         fsyncData) -> Expected<std::filesystem::path> {
    auto dir = collectionDirFor(collectionsDir, name);
    if (!dir)
        return dir;
    if (auto vacant = requireVacant(*dir); !vacant)
        return std::unexpected(vacant.error());

    auto root = Tree::Node::makeDirectory("root");
    if (auto written = writeCollection(CollectionLayout{*dir}, Tree::CollectionInfo{name, description}, *root, fsyncData);
        !written)
        return std::unexpected(written.error());
    rs_log("Created collection " + dir->string(), "Persist");
    return dir;
}

auto renameCollection(std::filesystem::path const& collectionDir, std::string const& newName, bool fsyncData)
        -> Expected<std::filesystem::path> {
    if (auto valid = requireCollectionDir(collectionDir); !valid)
        return std::unexpected(valid.error());
    auto target = collectionDirFor(collectionDir.parent_path(), newName);
    if (!target)
        return target;

    auto loaded = loadCollection(CollectionLayout{collectionDir});
    if (!loaded)
        return std::unexpected(loaded.error());

    if (*target != collectionDir) {
        if (auto vacant = requireVacant(*target); !vacant)
            return std::unexpected(vacant.error());
        std::error_code ec;
        std::filesystem::rename(collectionDir, *target, ec);
        if (ec)
            return std::unexpected(
                    Error{Error::Code::IoFailure, "Failed to rename " + collectionDir.string() + ": " + ec.message()});
    }

    loaded->info.name = newName;
    CollectionLayout layout{*target};
    if (auto written = writeFileAtomic(layout.manifestPath(), Codec::encodeManifest(loaded->info, *loaded->root), fsyncData);
        !written)
        return std::unexpected(written.error());
    rs_log("Renamed collection " + collectionDir.string() + " to " + target->string(), "Persist");
    return target;
}

auto deleteCollection(std::filesystem::path const& collectionDir) -> Expected<void> {
    if (auto valid = requireCollectionDir(collectionDir); !valid)
        return valid;
    std::error_code ec;
    std::filesystem::remove_all(collectionDir, ec);
    if (ec)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to delete " + collectionDir.string() + ": " + ec.message()});
    rs_log("Deleted collection " + collectionDir.string(), "Persist");
    return {};
}

auto exportCollection(std::filesystem::path const& collectionDir, std::filesystem::path const& target, bool fsyncData)
        -> Expected<void> {
    auto loaded = loadCollection(CollectionLayout{collectionDir});
    if (!loaded)
        return std::unexpected(loaded.error());
    return writeFileAtomic(target, Codec::encodeDocument(loaded->info, *loaded->root), fsyncData);
}

auto importCollection(std::filesystem::path const& collectionsDir, std::filesystem::path const& document, bool fsyncData)
        -> Expected<std::filesystem::path> {
    auto text = readTextFile(document);
    if (!text)
        return std::unexpected(text.error());
    auto decoded = Codec::decodeDocument(*text);
    if (!decoded)
        return std::unexpected(decoded.error());

    auto dir = collectionDirFor(collectionsDir, decoded->info.name);
    if (!dir)
        return dir;
    if (auto vacant = requireVacant(*dir); !vacant)
        return std::unexpected(vacant.error());
    if (auto written = writeCollection(CollectionLayout{*dir}, decoded->info, *decoded->root, fsyncData); !written)
        return std::unexpected(written.error());
    rs_log("Imported " + document.string() + " into " + dir->string(), "Persist");
    return dir;
}

} // namespace RS::Persist
