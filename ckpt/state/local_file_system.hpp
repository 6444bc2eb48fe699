// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include <ckpt/state/file_system.hpp>

namespace ckpt::state {

//! \brief OutputFile backed by a POSIX file descriptor
class LocalOutputFile : public OutputFile {
  public:
    using FileDescriptor = int;

    LocalOutputFile(std::filesystem::path path, FileDescriptor fd) : path_{std::move(path)}, fd_{fd} {}
    ~LocalOutputFile() override;

    // Not copyable nor movable
    LocalOutputFile(const LocalOutputFile&) = delete;
    LocalOutputFile& operator=(const LocalOutputFile&) = delete;

    void write(ByteView data) override;
    void sync() override;
    void close() override;
    uint64_t position() const override;

    const std::filesystem::path& path() const { return path_; }
    bool is_open() const { return fd_ != kInvalidFd; }

  private:
    static constexpr FileDescriptor kInvalidFd{-1};

    void ensure_open(const char* operation) const;

    std::filesystem::path path_;
    FileDescriptor fd_;
    uint64_t position_{0};
};

//! \brief FileSystem implementation on top of the local OS filesystem
class LocalFileSystem : public FileSystem {
  public:
    std::unique_ptr<OutputFile> create(const std::filesystem::path& path, WriteMode mode) override;
    bool remove(const std::filesystem::path& path, bool recursive) override;
    bool exists(const std::filesystem::path& path) const override;
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) const override;
};

}  // namespace ckpt::state
