#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RS::Persist {

inline constexpr std::string_view ManifestFileName     = "collection.json";
inline constexpr std::string_view RequestsDirectory    = "requests";
inline constexpr std::string_view RequestFileExtension = ".json";

/**
 * On-disk shape of one collection:
 *
 *   <dir>/collection.json       manifest (info and structure)
 *   <dir>/requests/<key>.json   one file per request
 */
class CollectionLayout {
public:
    explicit CollectionLayout(std::filesystem::path dir)
        : root(std::move(dir)) {}

    [[nodiscard]] auto dir() const -> std::filesystem::path const& { return this->root; }
    [[nodiscard]] auto manifestPath() const -> std::filesystem::path { return this->root / ManifestFileName; }
    [[nodiscard]] auto requestsDir() const -> std::filesystem::path { return this->root / RequestsDirectory; }

    // Fails with InvalidPath for keys that are not 32 lowercase hex characters.
    [[nodiscard]] auto requestPath(std::string_view key) const -> Expected<std::filesystem::path>;

    [[nodiscard]] auto hasManifest() const -> bool;

    // Keys of every `<key>.json` file in the requests directory; other entries are ignored.
    [[nodiscard]] auto listRequestKeys() const -> Expected<std::vector<std::string>>;

private:
    std::filesystem::path root;
};

} // namespace RS::Persist
