#include "persist/CollectionLayout.hpp"

#include "tree/Node.hpp"

#include <algorithm>
#include <system_error>

namespace RS::Persist {

auto CollectionLayout::requestPath(std::string_view key) const -> Expected<std::filesystem::path> {
    if (!Tree::isValidNodeKey(key))
        return std::unexpected(Error{Error::Code::InvalidPath, "Invalid request key '" + std::string(key) + "'"});
    std::string fileName{key};
    fileName.append(RequestFileExtension);
    return this->requestsDir() / fileName;
}

auto CollectionLayout::hasManifest() const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(this->manifestPath(), ec);
}

auto CollectionLayout::listRequestKeys() const -> Expected<std::vector<std::string>> {
    std::vector<std::string> keys;
    std::error_code          ec;
    auto const               dir = this->requestsDir();
    if (!std::filesystem::is_directory(dir, ec))
        return keys;

    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to list " + dir.string() + ": " + ec.message()});
    for (std::filesystem::directory_iterator end; it != end;) {
        auto const& path = it->path();
        if (path.extension() == RequestFileExtension) {
            auto stem = path.stem().string();
            if (Tree::isValidNodeKey(stem))
                keys.push_back(std::move(stem));
        }
        it.increment(ec);
        if (ec)
            return std::unexpected(Error{Error::Code::IoFailure, "Failed to list " + dir.string() + ": " + ec.message()});
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace RS::Persist
