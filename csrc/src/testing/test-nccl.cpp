// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Unit tests for the NCCL communicator: host-side exchange, the reductions used by the
// training loop, and the asynchronous all-gather consumed by the optimizer.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <cuda_bf16.h>
#include <cuda_runtime.h>

#include "runtime/optimizers/errors.h"
#include "utilities/allocator.h"
#include "utilities/comm.h"
#include "utilities/utils.h"
#include "utilities/test_utils.h"

using namespace testing_utils;

namespace {

// Returns true only if a single-rank communicator can be brought up (driver + NCCL)
bool nccl_available() {
    static bool checked = false;
    static bool available = false;

    if (!checked) {
        checked = true;
        if (!cuda_device_available()) {
            return false;
        }
        try {
            NCCLCommunicator::run_communicators(1, false, [&](NCCLCommunicator&) {
                available = true;
            });
        } catch (const std::exception&) {
            available = false;
        }
    }
    return available;
}

int get_cuda_device_count() {
    int device_count = 0;
    if (cudaGetDeviceCount(&device_count) != cudaSuccess) {
        (void)cudaGetLastError();
        return 0;
    }
    return device_count;
}

//! Ranks used by multi-rank tests: two if the machine has them, otherwise one.
int test_world() {
    return std::min(get_cuda_device_count(), 2);
}

} // anonymous namespace

// =============================================================================
// Communicator setup
// =============================================================================

TEST_CASE("NCCL communicator properties", "[nccl][basic]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    const int world = test_world();
    std::vector<int> ranks_seen(world, 0);

    NCCLCommunicator::run_communicators(world, false, [&](NCCLCommunicator& comm) {
        REQUIRE(comm.world_size() == world);
        REQUIRE(comm.rank() >= 0);
        REQUIRE(comm.rank() < world);
        REQUIRE(comm.stream() != nullptr);
        ranks_seen[comm.rank()] = 1;

        // barriers neither hang nor throw
        comm.barrier();
        comm.barrier();
    });

    REQUIRE(std::ranges::all_of(ranks_seen, [](int seen) { return seen == 1; }));
}

TEST_CASE("NCCL rejects more GPUs than available", "[nccl][error]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }
    REQUIRE_THROWS_AS(NCCLCommunicator::run_communicators(get_cuda_device_count() + 1, false, [](NCCLCommunicator&) {}),
                      std::runtime_error);
}

TEST_CASE("worker exceptions are rethrown by run_communicators", "[nccl][error]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }
    REQUIRE_THROWS_AS(NCCLCommunicator::run_communicators(1, false, [](NCCLCommunicator&) {
        throw optimizers::ShapeError("worker failure");
    }), optimizers::ShapeError);
}

TEST_CASE("generate_nccl_id returns unique IDs", "[nccl][id]") {
    if (!cuda_device_available()) {
        SKIP("CUDA not available");
    }

    auto id1 = NCCLCommunicator::generate_nccl_id();
    auto id2 = NCCLCommunicator::generate_nccl_id();
    REQUIRE(id1.size() == 128);
    REQUIRE(id1 != id2);
}

// =============================================================================
// Host exchange
// =============================================================================

TEST_CASE("NCCL host_gather and host_all_gather", "[nccl][gather]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    struct StepRecord {
        int Step;
        float Loss;
    };

    const int world = test_world();
    NCCLCommunicator::run_communicators(world, false, [&](NCCLCommunicator& comm) {
        auto gathered = comm.host_gather(StepRecord{comm.rank() * 10 + 1, 0.5f * comm.rank()});
        if (comm.rank() == 0) {
            REQUIRE(gathered.size() == static_cast<std::size_t>(world));
            for (int i = 0; i < world; ++i) {
                REQUIRE(gathered[i].Step == i * 10 + 1);
                REQUIRE(gathered[i].Loss == Catch::Approx(0.5f * i));
            }
        }

        auto all = comm.host_all_gather(comm.rank() + 100);
        REQUIRE(all.size() == static_cast<std::size_t>(world));
        for (int i = 0; i < world; ++i) {
            REQUIRE(all[i] == i + 100);
        }
    });
}

// =============================================================================
// Reductions
// =============================================================================

TEST_CASE("NCCL reduce_loss averages across ranks", "[nccl][reduce]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    NCCLCommunicator::run_communicators(test_world(), false, [&](NCCLCommunicator& comm) {
        TensorAllocator alloc;
        Tensor loss = to_device(alloc, "loss", std::vector<float>{2.f * (comm.rank() + 1)}, {1});
        comm.reduce_loss(loss.get<float>(), comm.stream());
        CUDA_CHECK(cudaStreamSynchronize(comm.stream()));

        const float expected = static_cast<float>(comm.world_size() + 1);
        REQUIRE(from_device<float>(loss)[0] == Catch::Approx(expected));
    });
}

TEST_CASE("NCCL gradient transaction and accuracy counts", "[nccl][reduce]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    NCCLCommunicator::run_communicators(test_world(), false, [&](NCCLCommunicator& comm) {
        TensorAllocator alloc;
        const int world = comm.world_size();
        Tensor grad = to_device(alloc, "grad", std::vector<float>(32, static_cast<float>(comm.rank())), {4, 8});
        Tensor correct = to_device(alloc, "correct", std::vector<std::int32_t>{comm.rank() + 1, 7}, {2});

        cudaEvent_t reduced = create_named_event("grads_reduced");
        CUDA_CHECK(cudaDeviceSynchronize());
        comm.begin_transaction(comm.stream());
        comm.schedule_all_reduce_avg(grad);
        comm.execute_transaction(reduced);
        comm.all_reduce_sum_int(correct.get<std::int32_t>(), 2, comm.stream());
        CUDA_CHECK(cudaEventSynchronize(reduced));
        CUDA_CHECK(cudaStreamSynchronize(comm.stream()));
        CUDA_CHECK(cudaEventDestroy(reduced));

        const float mean_rank = (world - 1) / 2.f;
        for (float g : from_device<float>(grad)) {
            REQUIRE(g == Catch::Approx(mean_rank));
        }
        auto counts = from_device<std::int32_t>(correct);
        REQUIRE(counts[0] == world * (world + 1) / 2);
        REQUIRE(counts[1] == 7 * world);
    });
}

// =============================================================================
// Asynchronous all-gather
// =============================================================================

TEST_CASE("NCCL all_gather fills one slot per rank", "[nccl][allgather][async]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    const bool memcpy_allgather = GENERATE(false, true);
    NCCLCommunicator::run_communicators(test_world(), memcpy_allgather, [&](NCCLCommunicator& comm) {
        TensorAllocator alloc;
        cudaStream_t stream;
        CUDA_CHECK(cudaStreamCreate(&stream));

        const int n = 96;
        std::vector<nv_bfloat16> local_bits(n);
        for (int i = 0; i < n; ++i) {
            std::uint16_t bits = float_to_bf16_bits(static_cast<float>((comm.rank() + 1) * (i % 4)));
            std::memcpy(&local_bits[i], &bits, sizeof(bits));
        }
        Tensor local = to_device(alloc, "local", local_bits, {n});
        Tensor gathered = alloc.allocate(ETensorDType::BF16, "gathered", {(long)comm.world_size(), n});

        PendingGather pending = comm.all_gather(local, gathered, stream);
        REQUIRE(pending.valid());
        Tensor& result = pending.wait(stream);
        REQUIRE(result.Data == gathered.Data);
        REQUIRE_FALSE(pending.valid());
        CUDA_CHECK(cudaStreamSynchronize(stream));

        auto host = bf16_from_device(gathered);
        for (int r = 0; r < comm.world_size(); ++r) {
            for (int i = 0; i < n; ++i) {
                REQUIRE(host[r * n + i] == static_cast<float>((r + 1) * (i % 4)));
            }
        }

        // a gather can only be consumed once
        REQUIRE_THROWS_AS(pending.wait(stream), std::logic_error);
        CUDA_CHECK(cudaStreamDestroy(stream));
    });
}

TEST_CASE("NCCL all_gather rejects mismatched buffers", "[nccl][allgather][error]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    NCCLCommunicator::run_communicators(1, false, [](NCCLCommunicator& comm) {
        TensorAllocator alloc;
        Tensor local = alloc.allocate(ETensorDType::BF16, "local", {16});
        Tensor wrong_size = alloc.allocate(ETensorDType::BF16, "gathered", {2, 16});
        Tensor wrong_type = alloc.allocate(ETensorDType::FP32, "gathered", {1, 16});
        REQUIRE_THROWS_AS(comm.all_gather(local, wrong_size, comm.stream()), std::logic_error);
        REQUIRE_THROWS_AS(comm.all_gather(local, wrong_type, comm.stream()), std::logic_error);
    });
}

TEST_CASE("a rank failing with a gather in flight does not stall its peers", "[nccl][allgather][error]") {
    if (!nccl_available()) {
        SKIP("NCCL not available");
    }

    REQUIRE_THROWS_AS(NCCLCommunicator::run_communicators(test_world(), false, [&](NCCLCommunicator& comm) {
        TensorAllocator alloc;
        const int n = 64;
        Tensor local = alloc.allocate(ETensorDType::BF16, "local", {n});
        Tensor gathered = alloc.allocate(ETensorDType::BF16, "gathered", {(long)comm.world_size(), n});
        fill_zero(local, comm.stream());

        PendingGather pending = comm.all_gather(local, gathered, comm.stream());
        if (comm.rank() != 0) {
            pending.wait(comm.stream());
        }
        CUDA_CHECK(cudaStreamSynchronize(comm.stream()));
        comm.barrier();

        // rank 0 leaves with its handle unconsumed; its communicator is torn down while unwinding
        if (comm.rank() == 0) {
            throw optimizers::ShapeError("rank 0 failed mid-step");
        }
    }), optimizers::ShapeError);
}

TEST_CASE("empty PendingGather cannot be waited on", "[nccl][allgather][error]") {
    PendingGather pending;
    REQUIRE_FALSE(pending.valid());
    REQUIRE_THROWS_AS(pending.wait(nullptr), std::logic_error);
}
