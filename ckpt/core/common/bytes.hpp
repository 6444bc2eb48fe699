// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ckpt {

using Bytes = std::basic_string<uint8_t>;

using ByteView = std::basic_string_view<uint8_t>;

inline ByteView string_view_to_byte_view(std::string_view v) {
    return {reinterpret_cast<const uint8_t*>(v.data()), v.length()};
}

}  // namespace ckpt
