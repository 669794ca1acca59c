// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <barrier>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <cuda_runtime.h>

#include "utilities/comm.h"
#include "utilities/tensor.h"
#include "utilities/utils.h"

namespace testing_utils {

//! Shared state of a set of LoopbackCollectives running in threads on the same device.
struct LoopbackExchange {
    explicit LoopbackExchange(int world) : World(world), Barrier(world), Targets(world, nullptr) {}

    int World;
    std::barrier<> Barrier;
    std::vector<std::byte*> Targets;
};

/**
 * @brief All-gather by plain device-to-device copies between threads.
 *
 * Every rank drains its producer stream before the exchange, so neither the local slot nor
 * any peer's gather buffer is still in use when the copies run.
 */
class LoopbackCollective : public ICollective {
public:
    LoopbackCollective(int rank, LoopbackExchange& exchange) : mRank(rank), mExchange(&exchange) {}

    [[nodiscard]] int rank() const override { return mRank; }
    [[nodiscard]] int world_size() const override { return mExchange->World; }

    [[nodiscard]] PendingGather all_gather(const Tensor& local, Tensor& gathered, cudaStream_t producer) override {
        if (gathered.nelem() != local.nelem() * world_size() || gathered.DType != local.DType) {
            throw std::logic_error("LoopbackCollective: gather buffer does not match");
        }
        CUDA_CHECK(cudaStreamSynchronize(producer));
        mExchange->Targets[mRank] = gathered.Data;
        mExchange->Barrier.arrive_and_wait();
        for (std::byte* target : mExchange->Targets) {
            CUDA_CHECK(cudaMemcpy(target + mRank * local.bytes(), local.Data, local.bytes(), cudaMemcpyDeviceToDevice));
        }
        mExchange->Barrier.arrive_and_wait();
        ++Gathers;

        cudaEvent_t done;
        CUDA_CHECK(cudaEventCreateWithFlags(&done, cudaEventDisableTiming));
        CUDA_CHECK(cudaEventRecord(done, producer));
        return PendingGather(gathered, done, {});
    }

    int Gathers = 0;

private:
    int mRank;
    LoopbackExchange* mExchange;
};

} // namespace testing_utils
