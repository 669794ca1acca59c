// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>

#include "runtime/training/schedule.h"

using Catch::Approx;

TEST_CASE("stable-decay schedule holds then decays linearly", "[training][schedule]") {
    const int total = 1770;
    StableDecaySchedule schedule(total, 0.4f, 0.1f);

    REQUIRE(schedule.eval(0) == 1.f);
    REQUIRE(schedule.eval(1000) == 1.f);
    REQUIRE(schedule.eval(1061) == 1.f);
    // the cooldown starts at 1 and is continuous
    REQUIRE(schedule.eval(1062) == Approx(1.f).epsilon(1e-5));
    // halfway through the cooldown
    REQUIRE(schedule.eval(1416) == Approx(0.5f + 0.5f * 0.1f).epsilon(1e-3));
    REQUIRE(schedule.eval(total - 1) == Approx(0.1 + 0.9 / (0.4 * total)).epsilon(1e-4));
    REQUIRE(schedule.eval(total) == Approx(0.1f));

    float previous = 1.f;
    for (int step = 0; step < total; ++step) {
        float value = schedule.eval(step);
        REQUIRE(value <= previous);
        REQUIRE(value >= 0.1f);
        previous = value;
    }
}

TEST_CASE("stable-decay schedule with a full cooldown", "[training][schedule]") {
    StableDecaySchedule schedule(100, 1.0f, 0.0f);
    REQUIRE(schedule.eval(0) == Approx(1.f));
    REQUIRE(schedule.eval(50) == Approx(0.5f));
    REQUIRE(schedule.eval(100) == Approx(0.f).margin(1e-7));
}

TEST_CASE("stable-decay schedule rejects invalid arguments", "[training][schedule][errors]") {
    REQUIRE_THROWS_AS(StableDecaySchedule(0, 0.4f, 0.1f), std::invalid_argument);
    REQUIRE_THROWS_AS(StableDecaySchedule(-5, 0.4f, 0.1f), std::invalid_argument);
    REQUIRE_THROWS_AS(StableDecaySchedule(100, 0.f, 0.1f), std::invalid_argument);
    REQUIRE_THROWS_AS(StableDecaySchedule(100, 1.5f, 0.1f), std::invalid_argument);
}

TEST_CASE("momentum warmup ramps linearly and then stays constant", "[training][schedule]") {
    MomentumWarmupSchedule schedule(300, 0.85f, 0.95f);
    REQUIRE(schedule.eval(0) == Approx(0.85f));
    REQUIRE(schedule.eval(150) == Approx(0.90f));
    REQUIRE(schedule.eval(300) == Approx(0.95f));
    REQUIRE(schedule.eval(5000) == Approx(0.95f));

    MomentumWarmupSchedule no_warmup(0, 0.85f, 0.95f);
    REQUIRE(no_warmup.eval(0) == Approx(0.95f));

    REQUIRE_THROWS_AS(MomentumWarmupSchedule(-1, 0.85f, 0.95f), std::invalid_argument);
}
