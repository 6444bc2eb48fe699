// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "human_size_option.hpp"

#include <catch2/catch.hpp>

#include <ckpt/core/common/util.hpp>

namespace ckpt::cmd::common {

TEST_CASE("validate_human_size", "[ckpt][infra][cli]") {
    CHECK(validate_human_size("0", 0, 1_Mebi).empty());
    CHECK(validate_human_size("4KB", 0, 1_Mebi).empty());
    CHECK(validate_human_size("1MB", 0, 1_Mebi).empty());
    CHECK(validate_human_size("abc", 0, 1_Mebi) == "Value abc is not a parseable size");
    CHECK(validate_human_size("2MB", 0, 1_Mebi) == "Value 2MB not in range [0.00 B - 1.00 MB]");
    CHECK_FALSE(validate_human_size("1KB", 2_Kibi, 1_Mebi).empty());
}

TEST_CASE("add_option_human_size", "[ckpt][infra][cli]") {
    CLI::App cli{"test"};
    size_t threshold{1_Kibi};
    add_option_human_size(cli, "--threshold", threshold, 0, 1_Mebi, "State threshold");

    SECTION("default is kept") {
        cli.parse("");
        CHECK(threshold == 1_Kibi);
    }

    SECTION("human readable value") {
        cli.parse("--threshold 64KB");
        CHECK(threshold == 64_Kibi);
    }

    SECTION("plain bytes") {
        cli.parse("--threshold 512");
        CHECK(threshold == 512);
    }

    SECTION("out of range") {
        CHECK_THROWS_AS(cli.parse("--threshold 2MB"), CLI::ValidationError);
        CHECK(threshold == 1_Kibi);
    }
}

}  // namespace ckpt::cmd::common
