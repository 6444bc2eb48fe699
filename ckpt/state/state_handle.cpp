// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_handle.hpp"

#include <absl/strings/str_cat.h>

#include <ckpt/infra/common/log.hpp>

namespace ckpt::state {

std::string ByteStreamStateHandle::to_string() const {
    return absl::StrCat("ByteStreamStateHandle{handle_name=", handle_name_, ", size=", data_.size(), "}");
}

void FileStateHandle::discard_state(FileSystem& fs) const {
    fs.remove(file_path_, /*recursive=*/false);

    try {
        delete_path_if_empty(fs, file_path_.parent_path());
    } catch (const std::exception& ex) {
        CKPT_DEBUG << "FileStateHandle: could not delete parent directory " << file_path_.parent_path().string()
                   << " [" << ex.what() << "]";
    }
}

std::string FileStateHandle::to_string() const {
    return absl::StrCat("FileStateHandle{file_path=", file_path_.string(), ", size=", state_size_, "}");
}

int64_t state_size(const StreamStateHandle& handle) {
    return std::visit([](const auto& h) { return h.state_size(); }, handle);
}

std::string to_string(const StreamStateHandle& handle) {
    return std::visit([](const auto& h) { return h.to_string(); }, handle);
}

void discard_state(const StreamStateHandle& handle, FileSystem& fs) {
    if (const auto* file_handle = std::get_if<FileStateHandle>(&handle)) {
        file_handle->discard_state(fs);
    }
}

}  // namespace ckpt::state
