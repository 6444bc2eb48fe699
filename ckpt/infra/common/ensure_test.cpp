// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <catch2/catch.hpp>

namespace ckpt {

using Catch::Matchers::Message;

TEST_CASE("ensure_pre_condition", "[ckpt][infra][ensure]") {
    CHECK_NOTHROW(ensure_pre_condition(true, []() { return "ignored"; }));
    CHECK_THROWS_AS(ensure_pre_condition(false, []() { return "error"; }), std::invalid_argument);
    CHECK_THROWS_MATCHES(ensure_pre_condition(false, []() { return "x " + std::to_string(42); }),
                         std::invalid_argument, Message("Pre-condition violation: x 42"));
}

}  // namespace ckpt
