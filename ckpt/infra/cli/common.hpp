// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <CLI/CLI.hpp>

#include <ckpt/infra/common/log.hpp>

namespace ckpt::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the checkpoint directory path, which must exist
void add_option_checkpoint_dir(CLI::App& cli, std::filesystem::path& checkpoint_dir);

}  // namespace ckpt::cmd::common
