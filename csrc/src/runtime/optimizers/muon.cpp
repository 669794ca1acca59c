// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "muon.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

#include <cuda_bf16.h>
#include <fmt/core.h>

#include "errors.h"
#include "newton_schulz.h"
#include "spectral_norm.h"
#include "kernels/kernels.h"
#include "utilities/allocator.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

namespace optimizers {

std::vector<ShardSlot> plan_shards(long num_params, int world_size) {
    if (world_size < 1) {
        throw std::invalid_argument(fmt::format("plan_shards: world size must be positive, got {}", world_size));
    }
    if (num_params < 0) {
        throw std::invalid_argument(fmt::format("plan_shards: negative parameter count {}", num_params));
    }

    std::vector<ShardSlot> plan;
    for (long base = 0; base < num_params; base += world_size) {
        for (int r = 0; r < world_size; ++r) {
            const long index = base + r;
            plan.push_back(ShardSlot{base, r, index < num_params ? index : -1});
        }
    }
    return plan;
}

long ParameterGroup::num_shards(int world_size) const {
    return div_ceil(static_cast<long>(Members.size()), static_cast<long>(world_size));
}

Muon::Muon(std::vector<ParameterSpec> params, std::vector<HyperParameters> hyper_sets, ICollective& comm,
           TensorAllocator& allocator, cudaStream_t stream, const std::string& coefficients,
           int power_iterations, std::uint64_t seed) :
    mParams(std::move(params)), mHyperSets(std::move(hyper_sets)), mComm(&comm),
    mRank(comm.rank()), mWorld(comm.world_size()), mStream(stream), mSeed(seed), mMomentum(allocator)
{
    // fail on a bad table name before allocating anything
    CoefficientTable table = coefficient_table_from_str(coefficients);

    long max_elements = 1;
    long max_inner = 1;
    long max_dim = 1;
    std::map<std::pair<int, long>, std::size_t> group_index;
    for (std::size_t i = 0; i < mParams.size(); ++i) {
        const ParameterSpec& spec = mParams[i];
        if (spec.Param.DType != ETensorDType::FP32) {
            throw ShapeError(fmt::format("Muon: parameter '{}' must be FP32, got {}", spec.Name, dtype_to_str(spec.Param.DType)));
        }
        if (spec.Param.Rank < 2 || spec.Param.nelem() == 0) {
            throw ShapeError(fmt::format("Muon: parameter '{}' of shape {} is not a matrix", spec.Name, spec.Param.shape_str()));
        }
        if (spec.HyperSet < 0 || spec.HyperSet >= static_cast<int>(mHyperSets.size())) {
            throw std::invalid_argument(fmt::format("Muon: parameter '{}' references unknown hyper-parameter set {}", spec.Name, spec.HyperSet));
        }
        if (mOwners.contains(spec.Name)) {
            throw std::invalid_argument(fmt::format("Muon: duplicate parameter name '{}'", spec.Name));
        }
        mOwners.emplace(spec.Name, -1);

        const long elements = static_cast<long>(spec.Param.nelem());
        const long rows = spec.Param.rows();
        const long cols = spec.Param.cols();
        max_elements = std::max(max_elements, elements);
        max_inner = std::max(max_inner, std::min(rows, cols));
        max_dim = std::max({max_dim, rows, cols});

        auto [it, inserted] = group_index.try_emplace({spec.HyperSet, elements}, mGroups.size());
        if (inserted) {
            mGroups.push_back(ParameterGroup{spec.HyperSet, elements, {}, {}, {}});
        }
        ParameterGroup& group = mGroups[it->second];
        if (group.Elements != elements) {
            throw ShapeError(fmt::format("Muon: parameter '{}' has {} elements, its group has {}", spec.Name, elements, group.Elements));
        }
        group.Members.push_back(i);
    }

    auto ctx = allocator.with_context("Muon");
    for (std::size_t g = 0; g < mGroups.size(); ++g) {
        ParameterGroup& group = mGroups[g];
        group.Gather = allocator.allocate(ETensorDType::BF16, "muon_gather", {static_cast<long>(mWorld), group.Elements});
        for (Tensor& slot : group.Local) {
            slot = allocator.allocate(ETensorDType::BF16, "muon_local", {group.Elements});
            // placeholder contributions send whatever the slot holds; make that zeros
            fill_zero(slot, mStream);
        }
        for (const ShardSlot& s : plan_shards(static_cast<long>(group.Members.size()), mWorld)) {
            if (s.Parameter >= 0) {
                mOwners[mParams[group.Members[s.Parameter]].Name] = s.Rank;
            }
        }
    }

    mOrthogonalizer = std::make_unique<NewtonSchulz>(std::move(table), max_elements, max_inner, allocator);
    mSpectralNorm = std::make_unique<SpectralNormEstimator>(max_dim, allocator, power_iterations);
    mSigma = allocator.allocate(ETensorDType::FP32, "muon_sigma", {1});
    mDegenerateCount = allocator.allocate(ETensorDType::INT32, "muon_degenerate", {1});
    fill_zero(mDegenerateCount, mStream);
}

Muon::~Muon() = default;

int Muon::owner(const std::string& name) const {
    auto found = mOwners.find(name);
    if (found == mOwners.end()) {
        throw std::out_of_range(fmt::format("Muon: unknown parameter '{}'", name));
    }
    return found->second;
}

int Muon::degenerate_count() const {
    int count = 0;
    CUDA_CHECK(cudaMemcpyAsync(&count, mDegenerateCount.Data, sizeof(int), cudaMemcpyDeviceToHost, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));
    return count;
}

/**
 * @brief Momentum update and orthogonalization of this rank's parameter in @p shard.
 *
 * The result lands in the local slot of the shard's parity. Ranks without a parameter in this
 * shard leave their slot untouched; its content is gathered but never applied.
 */
void Muon::compute_shard(ParameterGroup& group, long shard, const StepParameters& params, const GradientLookup& gradients) {
    const long index = shard * mWorld + mRank;
    if (index >= static_cast<long>(group.Members.size())) {
        return;
    }

    const ParameterSpec& spec = mParams[group.Members[index]];
    const HyperParameters& hp = mHyperSets[group.HyperSet];
    Tensor* grad = gradients(spec);
    if (grad == nullptr || grad->is_null()) {
        throw UninitializedGradientError(spec.Name);
    }
    if (!grad->same_shape(spec.Param)) {
        throw ShapeError(fmt::format("Muon: gradient of '{}' has shape {}, parameter has {}",
                                     spec.Name, grad->shape_str(), spec.Param.shape_str()));
    }

    Tensor update = mMomentum.update(spec.Name, *grad, params.Momentum, hp.Nesterov, mStream);
    Tensor& slot = group.Local[shard % 2];
    mOrthogonalizer->orthogonalize(as_matrix(update), slot, mStream);
}

/**
 * @brief Apply every gathered update of @p shard to its parameter, then cap its spectral norm.
 *
 * Runs identically on all ranks, so parameters stay replicated.
 */
void Muon::apply_shard(std::size_t group_index, long shard, Tensor& gathered, const StepParameters& params) {
    NVTX_RANGE_FN();
    const ParameterGroup& group = mGroups[group_index];
    const HyperParameters& hp = mHyperSets[group.HyperSet];
    const long base = shard * mWorld;

    for (int r = 0; r < mWorld; ++r) {
        const long index = base + r;
        if (index >= static_cast<long>(group.Members.size())) {
            break;
        }
        const std::size_t param_index = group.Members[index];
        Tensor param = as_matrix(mParams[param_index].Param);
        const float scale = std::sqrt(static_cast<float>(param.rows()) / static_cast<float>(param.cols()));
        const nv_bfloat16* update = gathered.get<nv_bfloat16>() + r * group.Elements;

        apply_update(param.get<float>(), update, -hp.LearningRate * params.LearningRateScale * scale, group.Elements, mStream);

        const std::uint64_t seed = mix_seed(mSeed, static_cast<std::uint64_t>(params.Step), param_index);
        mSpectralNorm->estimate(param, seed, mSigma.get<float>(), mStream);
        spectral_cap(param.get<float>(), mSigma.get<float>(), hp.WMax * scale, mDegenerateCount.get<int>(), group.Elements, mStream);
    }

    if (mObserver) {
        mObserver->on_applied(group_index, shard);
    }
}

/**
 * @brief Per group: for each shard i, compute i, apply i-1, then start gathering i.
 *
 * The gather of shard i is enqueued after apply(i-1), so it cannot overwrite the gather buffer
 * before apply(i-1) has read it. Compute of shard i+1 writes the other local slot while
 * gather(i) may still be reading slot i % 2.
 */
void Muon::step(const StepParameters& params, const GradientLookup& gradients) {
    NVTX_RANGE_FN();
    for (std::size_t g = 0; g < mGroups.size(); ++g) {
        ParameterGroup& group = mGroups[g];
        const long shards = group.num_shards(mWorld);

        PendingGather pending;
        for (long i = 0; i < shards; ++i) {
            compute_shard(group, i, params, gradients);
            if (i > 0) {
                apply_shard(g, i - 1, pending.wait(mStream), params);
            }
            pending = mComm->all_gather(group.Local[i % 2], group.Gather, mStream);
            if (mObserver) {
                mObserver->on_gather_issued(g, i);
            }
        }
        if (shards > 0) {
            apply_shard(g, shards - 1, pending.wait(mStream), params);
        }
    }
}

} // namespace optimizers
