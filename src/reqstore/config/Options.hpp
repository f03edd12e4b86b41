#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace RS {

struct StoreOptions {
    // Longest a store call waits for the collection lock before failing with Timeout.
    std::chrono::milliseconds lockTimeout{250};
};

struct SyncOptions {
    bool                      fsyncData = true;
    bool                      autosync  = true;
    std::chrono::milliseconds autosyncInterval{5000};
};

struct WorkspaceOptions {
    // Empty means resolveCollectionsDir().
    std::filesystem::path collectionsDir;
    StoreOptions          store;
    SyncOptions           sync;
    std::size_t           flushThreads = 2;
};

} // namespace RS
