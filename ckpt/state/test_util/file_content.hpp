// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <vector>

#include <ckpt/core/common/bytes.hpp>
#include <ckpt/infra/common/directories.hpp>

namespace ckpt::state::test_util {

//! Read the whole content of the file at \p path
inline Bytes read_file(const std::filesystem::path& path) {
    std::ifstream in{path, std::ios::binary};
    in.exceptions(std::ios::badbit);
    const std::vector<char> content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    return Bytes{reinterpret_cast<const uint8_t*>(content.data()), content.size()};
}

//! Generate \p size pseudo-random bytes, deterministic for a given \p seed
inline Bytes make_bytes(size_t size, uint32_t seed = 42) {
    std::mt19937 generator{seed};
    std::uniform_int_distribution<int> distr{0, 255};
    Bytes bytes(size, 0);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(distr(generator));
    }
    return bytes;
}

//! List the regular files directly contained in \p dir
inline std::vector<std::filesystem::path> list_files(const Directory& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator{dir.path()}) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    return files;
}

}  // namespace ckpt::state::test_util
