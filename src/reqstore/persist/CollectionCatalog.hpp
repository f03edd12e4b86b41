#pragma once

#include "core/Error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace RS::Persist {

struct CollectionMeta {
    std::string                           name;
    std::filesystem::path                 path;
    std::uintmax_t                        sizeBytes = 0;
    std::chrono::system_clock::time_point modified;
};

enum class CollectionSorting {
    Recent,
    Name,
    Size
};

[[nodiscard]] auto nextSorting(CollectionSorting sorting) -> CollectionSorting;
[[nodiscard]] auto prevSorting(CollectionSorting sorting) -> CollectionSorting;
[[nodiscard]] auto sortingToString(CollectionSorting sorting) -> std::string_view;

// Recent puts the newest first, Size the largest first, Name sorts ascending.
auto sortCollections(std::vector<CollectionMeta>& collections, CollectionSorting sorting) -> void;

// Every sub-directory of `collectionsDir` holding a manifest. Unreadable
// manifests are listed under their directory name.
[[nodiscard]] auto listCollections(std::filesystem::path const& collectionsDir,
                                   CollectionSorting            sorting = CollectionSorting::Recent)
        -> Expected<std::vector<CollectionMeta>>;

// Characters that cannot appear in a directory name are replaced by '_'.
[[nodiscard]] auto sanitizeFileName(std::string_view name) -> std::string;

// Two decimals and a binary unit, "1.50KB".
[[nodiscard]] auto readableByteSize(std::uintmax_t bytes) -> std::string;

// Creates `<collectionsDir>/<sanitized name>` with an empty root.
[[nodiscard]] auto createCollection(std::filesystem::path const& collectionsDir,
                                    std::string const&           name,
                                    std::string const&           description,
                                    bool                         fsyncData) -> Expected<std::filesystem::path>;

// Renames the directory and the collection name stored in the manifest.
[[nodiscard]] auto renameCollection(std::filesystem::path const& collectionDir, std::string const& newName, bool fsyncData)
        -> Expected<std::filesystem::path>;

[[nodiscard]] auto deleteCollection(std::filesystem::path const& collectionDir) -> Expected<void>;

// Writes the collection as one self-contained document.
[[nodiscard]] auto exportCollection(std::filesystem::path const& collectionDir,
                                    std::filesystem::path const& target,
                                    bool                         fsyncData) -> Expected<void>;

// Unpacks a document written by exportCollection into a new collection directory.
[[nodiscard]] auto importCollection(std::filesystem::path const& collectionsDir,
                                    std::filesystem::path const& document,
                                    bool                         fsyncData) -> Expected<std::filesystem::path>;

} // namespace RS::Persist
