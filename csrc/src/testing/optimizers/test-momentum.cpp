// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <cuda_runtime.h>

#include "runtime/optimizers/errors.h"
#include "runtime/optimizers/momentum_store.h"
#include "utilities/allocator.h"
#include "utilities/utils.h"
#include "utilities/test_utils.h"

using namespace testing_utils;
using optimizers::MomentumStore;

namespace {

// buf <- buf + (1 - mu) * (g - buf); returns the effective update.
std::vector<float> momentum_reference(std::vector<float>& buf, const std::vector<float>& g, float mu, bool nesterov) {
    std::vector<float> update(g.size());
    for (std::size_t i = 0; i < g.size(); ++i) {
        buf[i] = buf[i] + (1.f - mu) * (g[i] - buf[i]);
        update[i] = nesterov ? g[i] + mu * (buf[i] - g[i]) : buf[i];
    }
    return update;
}

} // namespace

TEST_CASE("momentum store matches the host reference", "[optimizers][momentum][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    const bool nesterov = GENERATE(true, false);
    const float mu = 0.9f;
    const int rows = 12;
    const int cols = 20;

    TensorAllocator alloc;
    cudaStream_t stream;
    CUDA_CHECK(cudaStreamCreate(&stream));
    MomentumStore store(alloc);

    std::vector<float> buf_ref(rows * cols, 0.f);
    Tensor grad = alloc.allocate(ETensorDType::FP32, "grad", {rows, cols});

    for (int step = 0; step < 3; ++step) {
        auto g = uniform_host(rows * cols, -1.f, 1.f, 100 + step);
        CUDA_CHECK(cudaMemcpy(grad.Data, g.data(), grad.bytes(), cudaMemcpyHostToDevice));

        Tensor update = store.update("w", grad, mu, nesterov, stream);
        CUDA_CHECK(cudaStreamSynchronize(stream));

        auto expected = momentum_reference(buf_ref, g, mu, nesterov);
        auto actual = from_device<float>(update);
        REQUIRE(relative_difference(actual, expected) < 1e-6);
        REQUIRE(relative_difference(from_device<float>(store.buffer("w")), buf_ref) < 1e-6);
    }

    // the nesterov lookahead is written into the gradient buffer
    if (nesterov) {
        REQUIRE(store.update("v", grad, mu, true, stream).Data == grad.Data);
    } else {
        REQUIRE(store.update("v", grad, mu, false, stream).Data == store.buffer("v").Data);
    }
    REQUIRE(store.size() == 2);

    CUDA_CHECK(cudaStreamDestroy(stream));
}

TEST_CASE("momentum buffers are created zero-filled and iterate by name", "[optimizers][momentum][cuda]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    TensorAllocator alloc;
    cudaStream_t stream;
    CUDA_CHECK(cudaStreamCreate(&stream));
    MomentumStore store(alloc);

    REQUIRE_FALSE(store.contains("b"));
    REQUIRE_THROWS_AS(store.buffer("b"), std::out_of_range);

    Tensor& b = store.get_or_create("b", {4, 4}, stream);
    store.get_or_create("a", {2, 8}, stream);
    CUDA_CHECK(cudaStreamSynchronize(stream));

    REQUIRE(store.contains("b"));
    for (float x : from_device<float>(b)) {
        REQUIRE(x == 0.f);
    }
    // a second lookup returns the existing buffer
    REQUIRE(store.get_or_create("b", {4, 4}, stream).Data == b.Data);

    std::vector<std::string> names;
    store.iterate_tensors([&](std::string name, const Tensor&) { names.push_back(name); });
    REQUIRE(names == std::vector<std::string>{"a", "b"});

    CUDA_CHECK(cudaStreamDestroy(stream));
}

TEST_CASE("momentum store rejects mismatched gradients", "[optimizers][momentum][cuda][errors]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }
    TensorAllocator alloc;
    cudaStream_t stream;
    CUDA_CHECK(cudaStreamCreate(&stream));
    MomentumStore store(alloc);

    Tensor grad = alloc.allocate(ETensorDType::FP32, "grad", {4, 4});
    fill_zero(grad, stream);
    store.update("w", grad, 0.9f, true, stream);

    Tensor other = alloc.allocate(ETensorDType::FP32, "other", {2, 8});
    REQUIRE_THROWS_AS(store.update("w", other, 0.9f, true, stream), optimizers::ShapeError);

    Tensor bf16 = alloc.allocate(ETensorDType::BF16, "bf16", {4, 4});
    REQUIRE_THROWS_AS(store.update("x", bf16, 0.9f, true, stream), optimizers::ShapeError);
    REQUIRE_FALSE(store.contains("x"));

    CUDA_CHECK(cudaStreamDestroy(stream));
}
