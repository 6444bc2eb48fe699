// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <ckpt/state/file_system.hpp>

namespace ckpt::state::test_util {

//! FileSystem decorator injecting failures into the wrapped FileSystem and the files it creates
class FaultyFileSystem : public FileSystem {
  public:
    explicit FaultyFileSystem(FileSystem& delegate) : delegate_{delegate} {}

    //! The number of upcoming create calls which fail as if the name was already taken
    size_t failing_creations{0};
    bool fail_write{false};
    bool fail_sync{false};
    bool fail_close{false};
    bool fail_position{false};
    bool fail_remove{false};
    bool fail_list{false};

    size_t create_calls{0};
    size_t remove_calls{0};
    std::vector<std::filesystem::path> created_paths;

    std::unique_ptr<OutputFile> create(const std::filesystem::path& path, WriteMode mode) override {
        ++create_calls;
        if (failing_creations > 0) {
            --failing_creations;
            throw std::runtime_error{"open failed for: " + path.string() + " error: File exists"};
        }
        auto file = delegate_.create(path, mode);
        created_paths.push_back(path);
        return std::make_unique<FaultyOutputFile>(std::move(file), *this);
    }

    bool remove(const std::filesystem::path& path, bool recursive) override {
        ++remove_calls;
        if (fail_remove) {
            throw std::runtime_error{"injected remove failure for: " + path.string()};
        }
        return delegate_.remove(path, recursive);
    }

    bool exists(const std::filesystem::path& path) const override {
        return delegate_.exists(path);
    }

    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) const override {
        if (fail_list) {
            throw std::runtime_error{"injected list failure for: " + path.string()};
        }
        return delegate_.list_directory(path);
    }

  private:
    class FaultyOutputFile : public OutputFile {
      public:
        FaultyOutputFile(std::unique_ptr<OutputFile> file, const FaultyFileSystem& fs)
            : file_{std::move(file)}, fs_{fs} {}

        void write(ByteView data) override {
            if (fs_.fail_write) throw std::runtime_error{"injected write failure"};
            file_->write(data);
        }
        void sync() override {
            if (fs_.fail_sync) throw std::runtime_error{"injected sync failure"};
            file_->sync();
        }
        void close() override {
            // the wrapped file gets closed anyway, as a real descriptor is released even on failure
            file_->close();
            if (fs_.fail_close) throw std::runtime_error{"injected close failure"};
        }
        uint64_t position() const override {
            if (fs_.fail_position) throw std::runtime_error{"injected position failure"};
            return file_->position();
        }

      private:
        std::unique_ptr<OutputFile> file_;
        const FaultyFileSystem& fs_;
    };

    FileSystem& delegate_;
};

}  // namespace ckpt::state::test_util
