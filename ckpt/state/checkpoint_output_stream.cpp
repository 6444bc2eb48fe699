// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "checkpoint_output_stream.hpp"

#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <absl/strings/str_cat.h>
#include <gsl/util>

#include <ckpt/infra/common/ensure.hpp>
#include <ckpt/infra/common/log.hpp>
#include <ckpt/state/stream_exception.hpp>
#include <ckpt/state/unique_file_creator.hpp>

namespace ckpt::state {

CheckpointStateOutputStream::CheckpointStateOutputStream(std::filesystem::path base_path,
                                                         FileSystem& fs,
                                                         size_t buffer_size,
                                                         size_t local_state_threshold)
    : base_path_{std::move(base_path)}, fs_{fs}, local_state_threshold_{local_state_threshold} {
    ensure_pre_condition(buffer_size > 0, [&]() { return "write buffer size must be positive"; });
    ensure_pre_condition(buffer_size >= local_state_threshold, [&]() {
        return absl::StrCat("write buffer size ", buffer_size, " lower than local state threshold ", local_state_threshold);
    });
    write_buffer_.resize(buffer_size);
}

CheckpointStateOutputStream::~CheckpointStateOutputStream() {
    close();
}

void CheckpointStateOutputStream::ensure_open() const {
    if (closed_.load(std::memory_order_acquire)) {
        throw StreamException{StreamError::kClosed, "Checkpoint stream is closed"};
    }
}

void CheckpointStateOutputStream::write(uint8_t b) {
    ensure_open();
    if (pos_.load(std::memory_order_relaxed) >= write_buffer_.size()) {
        flush();
    }
    size_t pos = pos_.load(std::memory_order_relaxed);
    if (pos >= write_buffer_.size()) {
        throw StreamException{StreamError::kClosed, "Checkpoint stream is closed"};
    }
    write_buffer_[pos] = b;
    // Termination pins the cursor concurrently, in such case the byte must not be accounted as written
    if (!pos_.compare_exchange_strong(pos, pos + 1, std::memory_order_relaxed)) {
        throw StreamException{StreamError::kClosed, "Checkpoint stream is closed"};
    }
}

void CheckpointStateOutputStream::write(ByteView data) {
    ensure_open();
    if (data.empty()) return;

    const size_t capacity{write_buffer_.size()};
    if (data.size() < capacity / 2) {
        // copy it into our write buffer first
        size_t pos = pos_.load(std::memory_order_relaxed);
        const size_t remaining{capacity - pos};
        if (data.size() > remaining) {
            // copy as much as fits, then flush the write buffer to make it clear again
            std::memcpy(write_buffer_.data() + pos, data.data(), remaining);
            data.remove_prefix(remaining);
            if (!pos_.compare_exchange_strong(pos, capacity, std::memory_order_relaxed)) {
                throw StreamException{StreamError::kClosed, "Checkpoint stream is closed"};
            }
            flush();
            pos = pos_.load(std::memory_order_relaxed);
        }
        if (pos + data.size() > capacity) {
            throw StreamException{StreamError::kClosed, "Checkpoint stream is closed"};
        }
        std::memcpy(write_buffer_.data() + pos, data.data(), data.size());
        if (!pos_.compare_exchange_strong(pos, pos + data.size(), std::memory_order_relaxed)) {
            throw StreamException{StreamError::kClosed, "Checkpoint stream is closed"};
        }
    } else {
        // flush the current buffer and write the bytes directly
        std::scoped_lock lock{mutex_};
        ensure_open();
        flush_buffer();
        out_file_->write(data);
    }
}

void CheckpointStateOutputStream::write(ByteView data, size_t offset, size_t length) {
    if (offset > data.size() || length > data.size() - offset) {
        throw std::out_of_range{absl::StrCat("invalid range offset=", offset, " length=", length,
                                             " for data of size ", data.size())};
    }
    write(data.substr(offset, length));
}

void CheckpointStateOutputStream::flush() {
    std::scoped_lock lock{mutex_};
    ensure_open();
    flush_buffer();
}

void CheckpointStateOutputStream::flush_buffer() {
    // initialize the state file if this is the first flush
    if (!out_file_) {
        create_state_file();
    }

    const size_t pos = pos_.load(std::memory_order_relaxed);
    if (pos > 0) {
        out_file_->write(ByteView{write_buffer_.data(), pos});
        pos_.store(0, std::memory_order_relaxed);
    }
}

void CheckpointStateOutputStream::create_state_file() {
    auto created_file = create_unique_file(fs_, base_path_);
    if (!created_file) {
        const auto& error{created_file.error()};
        if (!error.last_error) {
            throw StreamException{StreamError::kCreationExhausted, error.to_string()};
        }
        try {
            std::rethrow_exception(error.last_error);
        } catch (const std::exception&) {
            std::throw_with_nested(StreamException{StreamError::kCreationExhausted, error.to_string()});
        }
    }
    state_path_ = std::move(created_file->path);
    out_file_ = std::move(created_file->file);
    CKPT_DEBUG << "CheckpointStateOutputStream: created state file " << state_path_.string();
}

void CheckpointStateOutputStream::sync() {
    std::scoped_lock lock{mutex_};
    ensure_open();
    if (!out_file_) {
        throw StreamException{StreamError::kNoSink, "Cannot sync checkpoint stream: nothing has been flushed yet"};
    }
    out_file_->sync();
}

uint64_t CheckpointStateOutputStream::position() const {
    std::scoped_lock lock{mutex_};
    ensure_open();
    return pos_.load(std::memory_order_relaxed) + (out_file_ ? out_file_->position() : 0);
}

std::filesystem::path CheckpointStateOutputStream::state_path() const {
    std::scoped_lock lock{mutex_};
    return state_path_;
}

std::optional<StreamStateHandle> CheckpointStateOutputStream::close_and_get_handle() {
    std::scoped_lock lock{mutex_};
    if (closed_.load(std::memory_order_relaxed)) {
        throw StreamException{StreamError::kClosed, "Stream has already been closed and discarded"};
    }

    const size_t pos = pos_.load(std::memory_order_relaxed);

    // nothing was ever written
    if (!out_file_ && pos == 0) {
        closed_.store(true, std::memory_order_release);
        return std::nullopt;
    }

    if (!out_file_ && pos <= local_state_threshold_) {
        closed_.store(true, std::memory_order_release);
        Bytes bytes{write_buffer_.data(), pos};
        pos_.store(write_buffer_.size(), std::memory_order_relaxed);
        return ByteStreamStateHandle{make_state_path(base_path_).string(), std::move(bytes)};
    }

    [[maybe_unused]] auto _ = gsl::finally([this]() {
        pos_.store(write_buffer_.size(), std::memory_order_relaxed);
        closed_.store(true, std::memory_order_release);
    });

    try {
        flush_buffer();

        // make a best effort attempt to figure out the size
        int64_t size{FileStateHandle::kUnknownSize};
        try {
            size = static_cast<int64_t>(out_file_->position());
        } catch (const std::exception& ex) {
            CKPT_DEBUG << "CheckpointStateOutputStream: unknown size for " << state_path_.string() << " [" << ex.what() << "]";
        }

        out_file_->close();

        log::Debug("Checkpoint state committed", {"path", state_path_.string(), "size", std::to_string(size)});
        return FileStateHandle{state_path_, size};
    } catch (const std::exception& ex) {
        discard_state_file();

        std::throw_with_nested(StreamException{
            StreamError::kCommitFailed,
            absl::StrCat("Could not flush and close the file system output stream to ", state_path_.string(),
                         " in order to obtain the stream state handle: ", ex.what())});
    }
}

void CheckpointStateOutputStream::close() noexcept {
    std::scoped_lock lock{mutex_};
    if (closed_.load(std::memory_order_relaxed)) return;

    closed_.store(true, std::memory_order_release);

    // make sure write requests need to go to flush() where they recognize that the stream is closed
    pos_.store(write_buffer_.size(), std::memory_order_relaxed);

    if (out_file_) {
        discard_state_file();
    }
}

void CheckpointStateOutputStream::discard_state_file() noexcept {
    if (out_file_) {
        try {
            out_file_->close();
        } catch (const std::exception& ex) {
            CKPT_WARN << "Could not close the state stream for " << state_path_.string() << " [" << ex.what() << "]";
        }
    }
    if (state_path_.empty()) return;

    try {
        fs_.remove(state_path_, /*recursive=*/false);
    } catch (const std::exception& ex) {
        CKPT_WARN << "Cannot delete closed and discarded state stream for " << state_path_.string()
                  << " [" << ex.what() << "]";
        return;
    }

    try {
        delete_path_if_empty(fs_, base_path_);
    } catch (const std::exception& ex) {
        CKPT_DEBUG << "Could not delete the parent directory " << base_path_.string() << " [" << ex.what() << "]";
    }
}

}  // namespace ckpt::state
