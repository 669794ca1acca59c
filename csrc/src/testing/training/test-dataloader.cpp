// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "runtime/training/dataloader.h"
#include "utilities/tensor.h"

namespace fs = std::filesystem;

namespace {

//! Token file whose token at position i is (first + i) % 65536.
void write_token_file(const fs::path& path, std::int32_t num_tokens, std::uint16_t first,
                      std::int32_t magic = DataLoader::kMagic, std::int32_t version = DataLoader::kVersion,
                      std::int32_t written_tokens = -1) {
    std::int32_t header[256] = {};
    header[0] = magic;
    header[1] = version;
    header[2] = num_tokens;
    std::vector<std::uint16_t> tokens(written_tokens < 0 ? num_tokens : written_tokens);
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        tokens[i] = static_cast<std::uint16_t>(first + i);
    }
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(header), sizeof(header));
    out.write(reinterpret_cast<const char*>(tokens.data()), static_cast<std::streamsize>(tokens.size() * sizeof(std::uint16_t)));
}

struct TempDir {
    fs::path Path;
    TempDir() {
        Path = fs::temp_directory_path() / fmt::format("spectron_dataloader_{}", reinterpret_cast<std::uintptr_t>(this));
        fs::remove_all(Path);
        fs::create_directories(Path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(Path, ec);
    }
};

struct HostBatch {
    std::vector<std::int32_t> InputData;
    std::vector<std::int32_t> TargetData;
    Tensor Inputs;
    Tensor Targets;

    explicit HostBatch(int T) : InputData(T), TargetData(T) {
        Inputs = Tensor::from_pointer(reinterpret_cast<std::byte*>(InputData.data()), -1, ETensorDType::INT32, std::vector<long>{T});
        Targets = Tensor::from_pointer(reinterpret_cast<std::byte*>(TargetData.data()), -1, ETensorDType::INT32, std::vector<long>{T});
    }
};

} // namespace

TEST_CASE("token file header is validated", "[training][dataloader]") {
    TempDir dir;

    SECTION("valid") {
        write_token_file(dir.Path / "ok.bin", 100, 0);
        auto info = DataLoader::parse_token_file_header((dir.Path / "ok.bin").string());
        REQUIRE(info.NumTokens == 100);
    }
    SECTION("bad magic") {
        write_token_file(dir.Path / "magic.bin", 100, 0, 12345);
        REQUIRE_THROWS_AS(DataLoader::parse_token_file_header((dir.Path / "magic.bin").string()), std::runtime_error);
    }
    SECTION("bad version") {
        write_token_file(dir.Path / "version.bin", 100, 0, DataLoader::kMagic, 2);
        REQUIRE_THROWS_AS(DataLoader::parse_token_file_header((dir.Path / "version.bin").string()), std::runtime_error);
    }
    SECTION("truncated") {
        write_token_file(dir.Path / "short.bin", 100, 0, DataLoader::kMagic, DataLoader::kVersion, 50);
        REQUIRE_THROWS_AS(DataLoader::parse_token_file_header((dir.Path / "short.bin").string()), std::runtime_error);
    }
    SECTION("missing") {
        REQUIRE_THROWS_AS(DataLoader::parse_token_file_header((dir.Path / "missing.bin").string()), std::runtime_error);
    }
}

TEST_CASE("ranks read adjacent windows and targets are shifted by one", "[training][dataloader]") {
    TempDir dir;
    write_token_file(dir.Path / "train_000.bin", 100, 0);
    const int T = 8;

    DataLoader rank0((dir.Path / "train_*.bin").string(), T, 0, 2);
    DataLoader rank1((dir.Path / "train_*.bin").string(), T, 1, 2);
    HostBatch b0(T);
    HostBatch b1(T);

    for (int batch = 0; batch < 3; ++batch) {
        rank0.load_batch(b0.Inputs, b0.Targets);
        rank1.load_batch(b1.Inputs, b1.Targets);
        const int pos = batch * 2 * T;
        for (int t = 0; t < T; ++t) {
            REQUIRE(b0.InputData[t] == pos + t);
            REQUIRE(b0.TargetData[t] == pos + t + 1);
            REQUIRE(b1.InputData[t] == pos + T + t);
            REQUIRE(b1.TargetData[t] == pos + T + t + 1);
        }
    }
    REQUIRE(rank0.position() == 6 * T);
    REQUIRE(rank1.position() == rank0.position());
}

TEST_CASE("loader moves through files and wraps into the next epoch", "[training][dataloader]") {
    TempDir dir;
    // 2 full windows of 2 * 4 tokens fit into 20 tokens: positions 0 and 8 (8 + 9 = 17 < 20)
    write_token_file(dir.Path / "a.bin", 20, 1000);
    write_token_file(dir.Path / "b.bin", 20, 2000);
    const int T = 4;

    DataLoader loader((dir.Path / "*.bin").string(), T, 0, 2);
    REQUIRE(loader.num_files() == 2);
    REQUIRE(loader.num_tokens() == 40);
    REQUIRE(loader.batches_left_in_file() == 2);
    HostBatch b(T);

    std::vector<int> firsts;
    for (int i = 0; i < 5; ++i) {
        loader.load_batch(b.Inputs, b.Targets);
        firsts.push_back(b.InputData[0]);
    }
    REQUIRE(firsts == std::vector<int>{1000, 1008, 2000, 2008, 1000});
    REQUIRE(loader.epoch() == 1);
    REQUIRE(loader.file_index() == 0);
}

TEST_CASE("loader state can be restored", "[training][dataloader]") {
    TempDir dir;
    write_token_file(dir.Path / "a.bin", 64, 0);
    write_token_file(dir.Path / "b.bin", 64, 500);
    const int T = 4;
    HostBatch b(T);

    DataLoader first((dir.Path / "*.bin").string(), T, 0, 1);
    for (int i = 0; i < 17; ++i) {
        first.load_batch(b.Inputs, b.Targets);
    }
    const auto epoch = first.epoch();
    const auto file = first.file_index();
    const auto position = first.position();
    first.load_batch(b.Inputs, b.Targets);
    const std::vector<std::int32_t> expected = b.InputData;

    DataLoader second((dir.Path / "*.bin").string(), T, 0, 1);
    second.set_state(epoch, file, position);
    second.load_batch(b.Inputs, b.Targets);
    REQUIRE(b.InputData == expected);

    REQUIRE_THROWS_AS(second.set_state(0, 2, 0), std::out_of_range);
    REQUIRE_THROWS_AS(second.set_state(0, 0, 64), std::out_of_range);
    REQUIRE_THROWS_AS(second.set_state(-1, 0, 0), std::out_of_range);
}

TEST_CASE("loader rejects invalid configurations", "[training][dataloader][errors]") {
    TempDir dir;
    write_token_file(dir.Path / "tiny.bin", 10, 0);
    write_token_file(dir.Path / "ok.bin", 100, 0);

    REQUIRE_THROWS_AS(DataLoader((dir.Path / "none_*.bin").string(), 4, 0, 1), std::runtime_error);
    REQUIRE_THROWS_AS(DataLoader((dir.Path / "tiny.bin").string(), 8, 0, 2), std::runtime_error);
    REQUIRE_THROWS_AS(DataLoader((dir.Path / "ok.bin").string(), 4, 2, 2), std::runtime_error);

    DataLoader loader((dir.Path / "ok.bin").string(), 4, 0, 1);
    HostBatch wrong(5);
    REQUIRE_THROWS_AS(loader.load_batch(wrong.Inputs, wrong.Targets), std::runtime_error);
}

TEST_CASE("tokens outside the vocabulary are rejected", "[training][dataloader][errors]") {
    TempDir dir;
    // tokens 0..99; the second window of rank 0 with T = 8 reaches id 16
    write_token_file(dir.Path / "ids.bin", 100, 0);

    REQUIRE_THROWS_AS(DataLoader((dir.Path / "ids.bin").string(), 8, 0, 1, 0), std::runtime_error);
    REQUIRE_THROWS_AS(DataLoader((dir.Path / "ids.bin").string(), 8, 0, 1, DataLoader::kMaxVocabSize + 1), std::runtime_error);

    DataLoader loader((dir.Path / "ids.bin").string(), 8, 0, 1, 16);
    REQUIRE(loader.vocab_size() == 16);
    HostBatch batch(8);
    loader.load_batch(batch.Inputs, batch.Targets);
    REQUIRE(batch.TargetData.back() == 8);

    REQUIRE_THROWS_AS(loader.load_batch(batch.Inputs, batch.Targets), std::runtime_error);
    // a rejected window does not advance the loader
    REQUIRE(loader.position() == 8);
}
