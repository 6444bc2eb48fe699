// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "unique_file_creator.hpp"

#include <array>
#include <exception>

#include <absl/strings/str_cat.h>
#include <boost/endian/conversion.hpp>

#include <ckpt/core/common/random_number.hpp>
#include <ckpt/core/common/util.hpp>
#include <ckpt/infra/common/log.hpp>

namespace ckpt::state {

std::string FileCreationError::to_string() const {
    return absl::StrCat("Could not open output stream for state backend after ", attempts,
                        " attempts, last path: ", last_path.string(), " last error: ", last_cause);
}

std::string random_uuid() {
    thread_local RandomNumber rnd;

    std::array<uint8_t, 16> bytes{};
    boost::endian::store_big_u64(bytes.data(), rnd.generate_one());
    boost::endian::store_big_u64(bytes.data() + 8, rnd.generate_one());

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

    const std::string hex{to_hex(ByteView{bytes.data(), bytes.size()})};
    return absl::StrCat(hex.substr(0, 8), "-", hex.substr(8, 4), "-", hex.substr(12, 4), "-",
                        hex.substr(16, 4), "-", hex.substr(20, 12));
}

std::filesystem::path make_state_path(const std::filesystem::path& base_path) {
    return base_path / random_uuid();
}

FileCreationResult create_unique_file(FileSystem& fs, const std::filesystem::path& base_path, size_t max_attempts) {
    FileCreationError error;
    for (size_t attempt{0}; attempt < max_attempts; ++attempt) {
        auto state_path{make_state_path(base_path)};
        try {
            auto file = fs.create(state_path, WriteMode::kNoOverwrite);
            return CreatedFile{std::move(state_path), std::move(file)};
        } catch (const std::exception& ex) {
            CKPT_TRACE << "create_unique_file attempt " << (attempt + 1) << " failed for " << state_path.string()
                       << " [" << ex.what() << "]";
            error.last_path = std::move(state_path);
            error.last_cause = ex.what();
            error.last_error = std::current_exception();
        }
        error.attempts = attempt + 1;
    }
    return tl::unexpected{std::move(error)};
}

}  // namespace ckpt::state
