// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

#include <ckpt/core/common/bytes.hpp>
#include <ckpt/state/file_system.hpp>

namespace ckpt::state {

//! \brief State handle carrying the checkpoint bytes inline, no file backs it
class ByteStreamStateHandle {
  public:
    ByteStreamStateHandle(std::string handle_name, Bytes data)
        : handle_name_{std::move(handle_name)}, data_{std::move(data)} {}

    //! Descriptive name used for diagnostics only
    const std::string& handle_name() const { return handle_name_; }
    ByteView data() const { return data_; }
    int64_t state_size() const { return static_cast<int64_t>(data_.size()); }

    std::string to_string() const;

    friend bool operator==(const ByteStreamStateHandle&, const ByteStreamStateHandle&) = default;

  private:
    std::string handle_name_;
    Bytes data_;
};

//! \brief State handle referencing a file written on the checkpoint filesystem
class FileStateHandle {
  public:
    //! Value of state_size() when the length could not be determined
    static constexpr int64_t kUnknownSize{-1};

    FileStateHandle(std::filesystem::path file_path, int64_t state_size)
        : file_path_{std::move(file_path)}, state_size_{state_size} {}

    const std::filesystem::path& file_path() const { return file_path_; }
    int64_t state_size() const { return state_size_; }

    //! \brief Deletes the state file and then its parent directory if it became empty
    //! \remarks Parent directory deletion is best-effort, file deletion failures are propagated
    void discard_state(FileSystem& fs) const;

    std::string to_string() const;

    friend bool operator==(const FileStateHandle&, const FileStateHandle&) = default;

  private:
    std::filesystem::path file_path_;
    int64_t state_size_;
};

using StreamStateHandle = std::variant<ByteStreamStateHandle, FileStateHandle>;

int64_t state_size(const StreamStateHandle& handle);

std::string to_string(const StreamStateHandle& handle);

void discard_state(const StreamStateHandle& handle, FileSystem& fs);

}  // namespace ckpt::state
