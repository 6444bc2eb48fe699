// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace ckpt {

//! Ensure that a pre-condition is met, otherwise raise an invalid argument error with dynamically built message
//! Usage: `ensure_pre_condition(size > 0, [&]() { return "size must be positive: " + std::to_string(size); });`
inline void ensure_pre_condition(bool condition, const std::function<std::string()>& message_builder) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument("Pre-condition violation: " + message_builder());
    }
}

}  // namespace ckpt
