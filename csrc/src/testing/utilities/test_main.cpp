// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_session.hpp>

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

#include "test_config.h"

// Our own options are consumed here, everything else goes to Catch2.
int main(int argc, char** argv) {
    auto& cfg = testing_config::mutable_cfg();
    CLI::App app{"spectron unit tests"};
    app.allow_extras();
    app.add_option("--rows", cfg.Rows, "Rows of the random test matrices")->check(CLI::PositiveNumber);
    app.add_option("--cols", cfg.Cols, "Columns of the random test matrices")->check(CLI::PositiveNumber);
    app.add_option("--seed", cfg.Seed, "Seed of the random test data");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    const std::vector<std::string> remaining = app.remaining();
    std::vector<const char*> args{argv[0]};
    for (const auto& arg : remaining) {
        args.push_back(arg.c_str());
    }
    return Catch::Session().run(static_cast<int>(args.size()), args.data());
}
