#pragma once

#include "core/Error.hpp"

#include <filesystem>

namespace RS {

/**
 * Directory holding one sub-directory per collection.
 *
 * Resolution order:
 *   REQSTORE_COLLECTIONS_DIR
 *   $XDG_DATA_HOME/reqstore/collections
 *   $HOME/.local/share/reqstore/collections
 * Fails with InvalidPath when none of the variables is set.
 */
[[nodiscard]] auto resolveCollectionsDir() -> Expected<std::filesystem::path>;

[[nodiscard]] auto ensureDirectory(std::filesystem::path const& dir) -> Expected<void>;

} // namespace RS
