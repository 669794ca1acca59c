// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace testing_config {

//! Problem size of the orthogonalizer / estimator tests, settable from the test runner's command line.
struct TestSizeConfig {
    int Rows = 32;
    int Cols = 128;     //!< keep Rows/Cols well away from 1 for the singular-value bounds
    std::uint64_t Seed = 12345ULL;
};

inline TestSizeConfig& mutable_cfg() {
    static TestSizeConfig cfg{};
    return cfg;
}

inline const TestSizeConfig& get_test_config() {
    return mutable_cfg();
}

} // namespace testing_config
