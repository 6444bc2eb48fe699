// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "checkpoint_stream_factory.hpp"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <gsl/narrow>

#include <ckpt/infra/common/ensure.hpp>
#include <ckpt/infra/common/log.hpp>

namespace ckpt::state {

static size_t validate_file_state_threshold(int64_t file_state_threshold) {
    ensure_pre_condition(file_state_threshold >= 0, []() {
        return "The threshold for file state size must be zero or larger.";
    });
    ensure_pre_condition(file_state_threshold <= static_cast<int64_t>(kMaxFileStateThreshold), []() {
        return absl::StrCat("The threshold for file state size cannot be larger than ", kMaxFileStateThreshold);
    });
    return gsl::narrow<size_t>(file_state_threshold);
}

FsCheckpointStreamFactory::FsCheckpointStreamFactory(FileSystem& fs,
                                                     std::filesystem::path checkpoint_directory,
                                                     int64_t file_state_threshold,
                                                     size_t write_buffer_size)
    : fs_{fs},
      checkpoint_directory_{std::move(checkpoint_directory)},
      file_state_threshold_{validate_file_state_threshold(file_state_threshold)},
      write_buffer_size_{write_buffer_size} {
    ensure_pre_condition(write_buffer_size_ > 0, []() { return "The write buffer size must be positive."; });
}

FsCheckpointStreamFactory::FsCheckpointStreamFactory(FileSystem& fs, const CheckpointStreamSettings& settings)
    : FsCheckpointStreamFactory{fs,
                                settings.checkpoint_dir,
                                gsl::narrow<int64_t>(settings.file_state_threshold),
                                settings.write_buffer_size} {}

size_t FsCheckpointStreamFactory::buffer_size() const {
    return std::max(write_buffer_size_, file_state_threshold_);
}

std::unique_ptr<CheckpointStateOutputStream> FsCheckpointStreamFactory::create_checkpoint_state_output_stream(
    uint64_t checkpoint_id, uint64_t timestamp) const {
    CKPT_TRACE << "FsCheckpointStreamFactory: new stream checkpoint_id=" << checkpoint_id << " timestamp=" << timestamp
               << " buffer_size=" << buffer_size();
    return std::make_unique<CheckpointStateOutputStream>(checkpoint_directory_, fs_, buffer_size(), file_state_threshold_);
}

std::string FsCheckpointStreamFactory::to_string() const {
    return "File Stream Factory @ " + checkpoint_directory_.string();
}

}  // namespace ckpt::state
