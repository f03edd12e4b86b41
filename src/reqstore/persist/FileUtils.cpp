#include "persist/FileUtils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace RS::Persist {

namespace {

auto ioError(std::string const& what, std::filesystem::path const& path, int err) -> Error {
    return Error{Error::Code::IoFailure, what + " " + path.string() + ": " + std::strerror(err)};
}

} // namespace

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0)
        return std::unexpected(Error{Error::Code::IoFailure, std::string{"fsync failed: "} + std::strerror(errno)});
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return std::unexpected(ioError("Failed to open directory", dir, errno));
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

auto writeFileAtomic(std::filesystem::path const& path, std::string_view text, bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec)
            return std::unexpected(Error{Error::Code::IoFailure, "Failed to create " + parent.string() + ": " + ec.message()});
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0)
        return std::unexpected(ioError("Failed to open", tmpPath, errno));

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto written = ::write(fd, text.data() + totalWritten, text.size() - totalWritten);
        if (written < 0 && errno == EINTR)
            continue;
        if (written <= 0) {
            int err = errno;
            ::close(fd);
            std::filesystem::remove(tmpPath, ec);
            return std::unexpected(ioError("Failed to write", tmpPath, err));
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            ::close(fd);
            std::filesystem::remove(tmpPath, ec);
            return sync;
        }
    }

    if (::close(fd) != 0) {
        int err = errno;
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(ioError("Failed to close", tmpPath, err));
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(tmpPath, cleanup);
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to rename " + tmpPath.string() + ": " + ec.message()});
    }

    if (fsyncData && !parent.empty())
        return fsyncDirectory(parent);
    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    std::ifstream stream(path, std::ios::binary);
    if (!stream)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to open " + path.string()});
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (stream.bad())
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to read " + path.string()});
    return oss.str();
}

auto removeFileIfExists(std::filesystem::path const& path) -> Expected<void> {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to remove " + path.string() + ": " + ec.message()});
    return {};
}

auto fileSizeOrZero(std::filesystem::path const& path) -> std::uintmax_t {
    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    if (ec)
        return 0;
    return size;
}

auto directorySizeOrZero(std::filesystem::path const& dir) -> std::uintmax_t {
    std::error_code ec;
    std::uintmax_t  total = 0;
    for (std::filesystem::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc))
            total += fileSizeOrZero(it->path());
    }
    return total;
}

} // namespace RS::Persist
