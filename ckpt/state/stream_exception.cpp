// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stream_exception.hpp"

#include <magic_enum.hpp>

namespace ckpt::state {

StreamException::StreamException(StreamError err, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Stream error : " + std::string{magic_enum::enum_name(err)}
                          : message},
      err_{err} {}

}  // namespace ckpt::state
