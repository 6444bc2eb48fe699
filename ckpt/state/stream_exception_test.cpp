// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stream_exception.hpp"

#include <catch2/catch.hpp>

namespace ckpt::state {

TEST_CASE("StreamException", "[ckpt][state]") {
    SECTION("default message") {
        const StreamException ex{StreamError::kNoSink};
        CHECK(ex.err() == StreamError::kNoSink);
        CHECK(std::string{ex.what()} == "Stream error : kNoSink");
    }

    SECTION("custom message") {
        const StreamException ex{StreamError::kClosed, "Stream has already been closed and discarded"};
        CHECK(ex.err() == StreamError::kClosed);
        CHECK(std::string{ex.what()} == "Stream has already been closed and discarded");
    }
}

}  // namespace ckpt::state
