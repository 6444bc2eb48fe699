// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace ckpt::cmd::common {

//! \brief Checks that \p value is a human readable size (e.g. "4KB", "1 MB", "512") within [min_size, max_size]
//! \return an empty string if valid, the error description otherwise
std::string validate_human_size(const std::string& value, size_t min_size, size_t max_size);

struct HumanSizeParserValidator : public CLI::Validator {
    HumanSizeParserValidator(size_t min_size, size_t max_size);
};

//! \brief Set up parsing of a human readable bytes size, the current \p value is shown as default
CLI::Option* add_option_human_size(CLI::App& cli,
                                   const std::string& name,
                                   size_t& value,
                                   size_t min_size,
                                   size_t max_size,
                                   const std::string& description);

}  // namespace ckpt::cmd::common
