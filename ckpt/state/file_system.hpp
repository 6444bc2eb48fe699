// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include <ckpt/core/common/bytes.hpp>

namespace ckpt::state {

//! \brief How FileSystem::create behaves when the target path already exists
enum class WriteMode {
    kNoOverwrite,  // creation fails if a file already exists at the path
    kOverwrite,    // an existing file is truncated
};

//! \brief Writable handle to a file created through a FileSystem
//! \details Implementations throw std::runtime_error (or a subclass) on any I/O failure
class OutputFile {
  public:
    virtual ~OutputFile() = default;

    //! \brief Appends all bytes in \p data
    virtual void write(ByteView data) = 0;

    //! \brief Flushes written data to durable storage
    virtual void sync() = 0;

    //! \brief Closes the file, further operations except close() fail
    //! \remarks Closing an already closed file is a no-op
    virtual void close() = 0;

    //! \brief Returns the current length of the file, i.e. the amount of bytes written so far
    virtual uint64_t position() const = 0;
};

//! \brief Minimal set of filesystem primitives needed to persist checkpoint state
class FileSystem {
  public:
    virtual ~FileSystem() = default;

    //! \brief Creates a new file at \p path and opens it for writing
    virtual std::unique_ptr<OutputFile> create(const std::filesystem::path& path, WriteMode mode) = 0;

    //! \brief Deletes the file or directory at \p path
    //! \return true if something has been removed, false if nothing existed at the path
    virtual bool remove(const std::filesystem::path& path, bool recursive) = 0;

    //! \brief Checks whether anything exists at \p path
    virtual bool exists(const std::filesystem::path& path) const = 0;

    //! \brief Lists the entries directly contained in directory \p path
    virtual std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) const = 0;
};

//! \brief Deletes directory \p path if it exists and is empty
//! \return true if the path was missing or has been removed, false if it is not empty, cannot be listed
//! or was already gone when removed
//! \remarks Removal failures are propagated as exceptions
bool delete_path_if_empty(FileSystem& fs, const std::filesystem::path& path);

}  // namespace ckpt::state
