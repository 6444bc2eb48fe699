// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <ckpt/core/common/bytes.hpp>
#include <ckpt/state/file_system.hpp>
#include <ckpt/state/state_handle.hpp>

namespace ckpt::state {

//! \brief Output stream for checkpoint state that writes into a randomly named file within a base directory and
//! returns a StreamStateHandle when closed.
//! \details Written bytes are collected in a write buffer in front of the state file. The state file is created on
//! the first flush only, so that state not exceeding the inline threshold never touches the filesystem and is
//! returned inline in a ByteStreamStateHandle.
//! A stream terminates exactly once: either close_and_get_handle() commits the state or close() discards it,
//! deleting any partially written file. Destroying a stream which has not been terminated discards it.
//! \warning A single producer thread is expected to write, only termination may come from other threads
class CheckpointStateOutputStream {
  public:
    //! \param base_path the directory where the state file gets created, it must already exist
    //! \param fs the filesystem used to create and delete the state file, must outlive this stream
    //! \param buffer_size the write buffer capacity, must be positive and not lower than local_state_threshold
    //! \param local_state_threshold state up to this size is returned inline rather than written into a file
    CheckpointStateOutputStream(std::filesystem::path base_path,
                                FileSystem& fs,
                                size_t buffer_size,
                                size_t local_state_threshold);
    ~CheckpointStateOutputStream();

    // Not copyable nor movable
    CheckpointStateOutputStream(const CheckpointStateOutputStream&) = delete;
    CheckpointStateOutputStream& operator=(const CheckpointStateOutputStream&) = delete;

    void write(uint8_t b);
    void write(ByteView data);
    void write(ByteView data, size_t offset, size_t length);

    //! \brief Writes the buffered bytes to the state file, creating the state file if it does not exist yet
    void flush();

    //! \brief Forces everything written to the state file so far to durable storage
    void sync();

    //! \brief Total amount of bytes written so far, either buffered or already in the state file
    uint64_t position() const;

    bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    //! \brief The path of the state file, empty until the state file has been created
    std::filesystem::path state_path() const;

    size_t buffer_size() const { return write_buffer_.size(); }
    size_t local_state_threshold() const { return local_state_threshold_; }

    //! \brief Closes the stream and returns a handle to the written state
    //! \return std::nullopt if nothing has ever been written, the handle otherwise
    //! \throws StreamException with StreamError::kClosed if the stream has already been terminated
    //! \throws StreamException with StreamError::kCommitFailed (nested over the cause) if the state file could not
    //! be flushed or closed, the partial state file has been deleted in such case
    std::optional<StreamStateHandle> close_and_get_handle();

    //! \brief Discards the stream, deleting the state file if any. Calling it more than once has no effect
    //! \remarks Cleanup failures are logged and never propagated
    void close() noexcept;

  private:
    void ensure_open() const;
    void flush_buffer();
    void create_state_file();
    void discard_state_file() noexcept;

    const std::filesystem::path base_path_;
    FileSystem& fs_;
    const size_t local_state_threshold_;

    std::vector<uint8_t> write_buffer_;

    //! Write cursor into write_buffer_, pinned to the buffer capacity on termination
    std::atomic<size_t> pos_{0};

    std::unique_ptr<OutputFile> out_file_;
    std::filesystem::path state_path_;

    std::atomic_bool closed_{false};

    //! Serializes termination against flushing and against itself
    mutable std::mutex mutex_;
};

}  // namespace ckpt::state
