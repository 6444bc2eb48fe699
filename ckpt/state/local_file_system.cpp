// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "local_file_system.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include <ckpt/infra/common/log.hpp>
#include <ckpt/infra/common/safe_strerror.hpp>

namespace ckpt::state {

static constexpr mode_t kDefaultFileMode{0644};

LocalOutputFile::~LocalOutputFile() {
    if (fd_ != kInvalidFd) {
        if (::close(fd_) == -1) {
            const int err{errno};
            CKPT_WARN << "LocalOutputFile: close failed for: " << path_.string() << " error: " << safe_strerror(err);
        }
    }
}

void LocalOutputFile::ensure_open(const char* operation) const {
    if (fd_ == kInvalidFd) {
        throw std::runtime_error{std::string{operation} + " failed for: " + path_.string() + " error: file is closed"};
    }
}

void LocalOutputFile::write(ByteView data) {
    ensure_open("write");
    while (!data.empty()) {
        const ssize_t written = ::write(fd_, data.data(), data.size());
        if (written == -1) {
            const int err{errno};
            if (err == EINTR) continue;
            throw std::runtime_error{"write failed for: " + path_.string() + " error: " + safe_strerror(err)};
        }
        position_ += static_cast<uint64_t>(written);
        data.remove_prefix(static_cast<size_t>(written));
    }
}

void LocalOutputFile::sync() {
    ensure_open("fsync");
    if (::fsync(fd_) == -1) {
        const int err{errno};
        throw std::runtime_error{"fsync failed for: " + path_.string() + " error: " + safe_strerror(err)};
    }
}

void LocalOutputFile::close() {
    if (fd_ == kInvalidFd) return;

    const FileDescriptor fd = fd_;
    fd_ = kInvalidFd;
    // The descriptor is released even when close reports an error
    if (::close(fd) == -1) {
        const int err{errno};
        throw std::runtime_error{"close failed for: " + path_.string() + " error: " + safe_strerror(err)};
    }
}

uint64_t LocalOutputFile::position() const {
    ensure_open("position");
    return position_;
}

std::unique_ptr<OutputFile> LocalFileSystem::create(const std::filesystem::path& path, WriteMode mode) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == WriteMode::kNoOverwrite) ? O_EXCL : O_TRUNC;

    LocalOutputFile::FileDescriptor fd{-1};
    do {
        fd = ::open(path.c_str(), flags, kDefaultFileMode);
    } while (fd == -1 && errno == EINTR);
    if (fd == -1) {
        const int err{errno};
        throw std::runtime_error{"open failed for: " + path.string() + " error: " + safe_strerror(err)};
    }
    return std::make_unique<LocalOutputFile>(path, fd);
}

bool LocalFileSystem::remove(const std::filesystem::path& path, bool recursive) {
    std::error_code ec;
    if (recursive) {
        const auto removed = std::filesystem::remove_all(path, ec);
        if (ec) {
            throw std::filesystem::filesystem_error{"remove_all failed", path, ec};
        }
        return removed > 0;
    }
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        throw std::filesystem::filesystem_error{"remove failed", path, ec};
    }
    return removed;
}

bool LocalFileSystem::exists(const std::filesystem::path& path) const {
    return std::filesystem::exists(path);
}

std::vector<std::filesystem::path> LocalFileSystem::list_directory(const std::filesystem::path& path) const {
    std::vector<std::filesystem::path> entries;
    for (const auto& entry : std::filesystem::directory_iterator(path)) {
        entries.push_back(entry.path());
    }
    return entries;
}

}  // namespace ckpt::state
