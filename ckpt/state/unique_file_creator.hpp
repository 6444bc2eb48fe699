// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include <tl/expected.hpp>

#include <ckpt/state/file_system.hpp>

namespace ckpt::state {

//! Maximum number of attempts made to create a uniquely named state file
inline constexpr size_t kMaxFileCreationAttempts{10};

//! \brief A freshly created state file together with its path
struct CreatedFile {
    std::filesystem::path path;
    std::unique_ptr<OutputFile> file;
};

//! \brief Failure description after all creation attempts have been exhausted
struct FileCreationError {
    size_t attempts{0};
    std::filesystem::path last_path;
    std::string last_cause;
    std::exception_ptr last_error;

    std::string to_string() const;
};

using FileCreationResult = tl::expected<CreatedFile, FileCreationError>;

//! \brief Generates a random version 4 UUID in canonical textual form (e.g. 3f2504e0-4f89-41d3-9a0c-0305e82c3301)
std::string random_uuid();

//! \brief Builds a random, statistically unique state file path within \p base_path
std::filesystem::path make_state_path(const std::filesystem::path& base_path);

//! \brief Creates a new file with a random name within \p base_path without overwriting any existing file
//! \details Any creation failure (name collision included) is retried with a fresh name up to \p max_attempts times
//! \return the created file or the failure details when all attempts failed
FileCreationResult create_unique_file(FileSystem& fs,
                                      const std::filesystem::path& base_path,
                                      size_t max_attempts = kMaxFileCreationAttempts);

}  // namespace ckpt::state
