#include "config/DataPaths.hpp"

#include <cstdlib>
#include <system_error>

namespace RS {

namespace {

auto nonEmptyEnv(const char* name) -> const char* {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0')
        return nullptr;
    return value;
}

} // namespace

auto resolveCollectionsDir() -> Expected<std::filesystem::path> {
    if (const char* explicitDir = nonEmptyEnv("REQSTORE_COLLECTIONS_DIR"))
        return std::filesystem::path{explicitDir};
    if (const char* dataHome = nonEmptyEnv("XDG_DATA_HOME"))
        return std::filesystem::path{dataHome} / "reqstore" / "collections";
    if (const char* home = nonEmptyEnv("HOME"))
        return std::filesystem::path{home} / ".local" / "share" / "reqstore" / "collections";
    return std::unexpected(Error{Error::Code::InvalidPath, "Unable to resolve a data directory: HOME is not set"});
}

auto ensureDirectory(std::filesystem::path const& dir) -> Expected<void> {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec))
        return {};
    if (std::filesystem::exists(dir, ec))
        return std::unexpected(Error{Error::Code::InvalidPath, dir.string() + " exists and is not a directory"});
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to create " + dir.string() + ": " + ec.message()});
    return {};
}

} // namespace RS
