// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "file_system.hpp"

#include <stdexcept>

namespace ckpt::state {

bool delete_path_if_empty(FileSystem& fs, const std::filesystem::path& path) {
    if (!fs.exists(path)) {
        return true;
    }

    std::vector<std::filesystem::path> entries;
    try {
        entries = fs.list_directory(path);
    } catch (const std::exception&) {
        return false;
    }
    if (!entries.empty()) {
        return false;
    }

    return fs.remove(path, /*recursive=*/false);
}

}  // namespace ckpt::state
