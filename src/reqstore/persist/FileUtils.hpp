#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace RS::Persist {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Writes `<path>.tmp`, optionally fsyncs it, renames it over `path` and fsyncs
// the parent directory. Readers see the old or the new content, never a mix.
[[nodiscard]] auto writeFileAtomic(std::filesystem::path const& path, std::string_view text, bool fsyncData)
        -> Expected<void>;

[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

// A missing file counts as removed.
[[nodiscard]] auto removeFileIfExists(std::filesystem::path const& path) -> Expected<void>;

[[nodiscard]] auto fileSizeOrZero(std::filesystem::path const& path) -> std::uintmax_t;
// Sum of regular file sizes below `dir`.
[[nodiscard]] auto directorySizeOrZero(std::filesystem::path const& dir) -> std::uintmax_t;

} // namespace RS::Persist
