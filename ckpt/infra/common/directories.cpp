// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include <ckpt/core/common/random_number.hpp>

namespace ckpt {

static std::string random_string(size_t len) {
    static constexpr std::string_view kAlphaNum{
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"};

    static constexpr size_t kNumberOfCharacters{kAlphaNum.length()};

    // yield random numbers up to and including kNumberOfCharacters - 1
    RandomNumber rnd{0, kNumberOfCharacters - 1};

    std::string s;
    s.reserve(len);

    for (size_t i{0}; i < len; ++i) {
        size_t random_number{rnd.generate_one()};
        s += kAlphaNum[random_number];
    }

    return s;
}

Directory::Directory(const std::filesystem::path& directory_path, bool must_create) {
    if (directory_path.empty()) {
        path_ = std::filesystem::current_path();
    } else {
        path_ = directory_path;
    }
    if (must_create) {
        create();
    }
}

const std::filesystem::path& Directory::path() const { return path_; }

bool Directory::exists() const { return (std::filesystem::exists(path_) && std::filesystem::is_directory(path_)); }

void Directory::create() {
    if (exists()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument("Directory " + path_.string() + " does not exist and could not be created");
    }
}

std::filesystem::path TemporaryDirectory::get_os_temporary_path() { return std::filesystem::temp_directory_path(); }

std::filesystem::path TemporaryDirectory::get_unique_temporary_path(const std::filesystem::path& base_path) {
    if (base_path.empty()) {
        throw std::invalid_argument("Temporary base path is empty");
    }

    const auto absolute_base_path{std::filesystem::absolute(base_path)};
    if (!std::filesystem::exists(absolute_base_path) || !std::filesystem::is_directory(absolute_base_path)) {
        throw std::invalid_argument("Path " + absolute_base_path.string() + " does not exist or is not a directory");
    }

    //! Build random paths appending random strings of fixed length to base path
    for (int i = 0; i < 1000; ++i) {
        auto new_absolute_base_path{absolute_base_path / random_string(10)};
        if (!std::filesystem::exists(new_absolute_base_path)) {
            return new_absolute_base_path;
        }
    }

    //! We were unable to find a valid unique non-existent path
    throw std::runtime_error("Unable to find a valid unique non-existent path");
}

std::filesystem::path TemporaryDirectory::get_unique_temporary_path() {
    const auto base_path = TemporaryDirectory::get_os_temporary_path();
    return TemporaryDirectory::get_unique_temporary_path(base_path);
}

}  // namespace ckpt
