// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "safe_strerror.hpp"

#include <cerrno>

#include <catch2/catch.hpp>

namespace ckpt {

TEST_CASE("safe_strerror", "[ckpt][infra][safe_strerror]") {
    CHECK_FALSE(safe_strerror(ENOENT).empty());
    CHECK_FALSE(safe_strerror(EEXIST).empty());
    CHECK(safe_strerror(EEXIST) != safe_strerror(ENOENT));
}

}  // namespace ckpt
