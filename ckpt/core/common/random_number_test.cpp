// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "random_number.hpp"

#include <set>

#include <catch2/catch.hpp>

namespace ckpt {

TEST_CASE("RandomNumber closed interval", "[ckpt][core][random]") {
    RandomNumber random_number{10, 13};
    std::set<uint64_t> seen;
    for (int i{0}; i < 1'000; ++i) {
        const auto number{random_number.generate_one()};
        REQUIRE((10 <= number && number <= 13));
        seen.insert(number);
    }
    CHECK(seen.size() == 4);
}

TEST_CASE("RandomNumber full range", "[ckpt][core][random]") {
    RandomNumber random_number;
    CHECK(random_number.generate_one() != random_number.generate_one());
}

}  // namespace ckpt
