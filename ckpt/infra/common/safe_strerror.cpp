// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "safe_strerror.hpp"

#include <cstring>

namespace ckpt {

// GNU strerror_r may return a pointer to a static string instead of filling the buffer
[[maybe_unused]] static const char* strerror_result(int result, const char* msg) {
    return result == 0 ? msg : "Unknown error";
}

[[maybe_unused]] static const char* strerror_result(const char* result, const char* /*msg*/) {
    return result != nullptr ? result : "Unknown error";
}

std::string safe_strerror(int err_code) {
    char msg[256];
    msg[0] = '\0';
    const char* text = strerror_result(strerror_r(err_code, msg, sizeof(msg)), msg);
    msg[sizeof(msg) - 1] = '\0';
    return {text};
}

}  // namespace ckpt
