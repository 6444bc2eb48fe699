// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <ckpt/state/checkpoint_output_stream.hpp>
#include <ckpt/state/file_system.hpp>

namespace ckpt::state {

//! Maximum size of state that is stored with the metadata, rather than in files
inline constexpr size_t kMaxFileStateThreshold{1024 * 1024};

//! Default size for the write buffer
inline constexpr size_t kDefaultWriteBufferSize{4096};

//! \brief The configuration of a FsCheckpointStreamFactory as collected from command line or other sources
struct CheckpointStreamSettings {
    //! The directory where state files are written, it must already exist
    std::filesystem::path checkpoint_dir;
    //! State up to this size is returned inline rather than written into files
    size_t file_state_threshold{0};
    //! The minimum capacity of the stream write buffers
    size_t write_buffer_size{kDefaultWriteBufferSize};
};

//! \brief Factory of checkpoint streams writing their state into randomly named files within a given directory.
//! If the state written to a stream is fewer bytes than a configurable threshold, then no files are written, but
//! the state is returned inline in the state handle instead. This reduces the problem of many small files holding
//! just few bytes.
//! \details The checkpoint directory must already exist: this factory never checks nor creates it, because such
//! checks would be issued for each stream and may flood the metadata service of remote filesystems.
class FsCheckpointStreamFactory {
  public:
    //! \param fs the filesystem to write to, must outlive this factory and all the streams it creates
    //! \param checkpoint_directory the directory where state files are written
    //! \param file_state_threshold state up to this size is stored inline, in range [0, kMaxFileStateThreshold]
    //! \param write_buffer_size the minimum write buffer capacity, must be positive
    //! \throws std::invalid_argument if a parameter is out of range
    FsCheckpointStreamFactory(FileSystem& fs,
                              std::filesystem::path checkpoint_directory,
                              int64_t file_state_threshold,
                              size_t write_buffer_size = kDefaultWriteBufferSize);

    FsCheckpointStreamFactory(FileSystem& fs, const CheckpointStreamSettings& settings);

    //! \brief Creates a new stream for checkpoint state, no filesystem operation is performed
    std::unique_ptr<CheckpointStateOutputStream> create_checkpoint_state_output_stream(uint64_t checkpoint_id,
                                                                                       uint64_t timestamp) const;

    const std::filesystem::path& checkpoint_directory() const { return checkpoint_directory_; }
    size_t file_state_threshold() const { return file_state_threshold_; }

    //! The write buffer capacity of the created streams
    size_t buffer_size() const;

    std::string to_string() const;

  private:
    FileSystem& fs_;
    std::filesystem::path checkpoint_directory_;
    size_t file_state_threshold_;
    size_t write_buffer_size_;
};

}  // namespace ckpt::state
