// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Muon: momentum SGD whose updates are orthogonalized by a Newton-Schulz iteration.
// The orthogonalization of a parameter group is sharded round-robin across ranks; each shard's
// results are all-gathered asynchronously while the next shard is being computed, and every rank
// then applies the gathered updates and caps the spectral norm of the updated weights.
//
// Hidden matrices only; embeddings and (optionally) the LM head are optimized by AdamW.

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_MUON_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_MUON_H

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <cuda_runtime.h>

#include "momentum_store.h"
#include "utilities/tensor.h"

class ICollective;
class TensorAllocator;

namespace optimizers {

class NewtonSchulz;
class SpectralNormEstimator;

//! Hyper-parameters shared by a set of parameters. The momentum coefficient comes from StepParameters.
struct HyperParameters {
    float LearningRate = 0.05f;
    bool Nesterov = true;
    float WMax = 8.0f;          //!< spectral cap, in units of sqrt(rows/cols)
};

struct ParameterSpec {
    std::string Name;
    Tensor Param;               //!< FP32, rank >= 2; trailing dimensions are flattened into columns
    int HyperSet = 0;           //!< index into the hyper-parameter sets given to Muon
};

//! Values injected by the training loop for one step.
struct StepParameters {
    float LearningRateScale = 1.0f;
    float Momentum = 0.95f;
    int Step = 0;               //!< seeds the power iteration
};

//! One entry of the round-robin plan: at shard base @c Base, rank @c Rank computes
//! parameter @c Parameter, or contributes a placeholder if it is -1.
struct ShardSlot {
    long Base;
    int Rank;
    long Parameter;
};

/**
 * @brief Round-robin assignment of @p num_params parameters to @p world_size ranks.
 *
 * Shard i has base i * world_size; rank r of that shard handles parameter base + r if it exists.
 * Every parameter appears exactly once. Pure host function.
 *
 * @throws std::invalid_argument If @p world_size < 1 or @p num_params < 0.
 */
std::vector<ShardSlot> plan_shards(long num_params, int world_size);

/**
 * @brief Parameters that share a hyper-parameter set and an element count.
 *
 * The element count is what allows a single fixed-size gather buffer per group.
 */
struct ParameterGroup {
    int HyperSet;
    long Elements;
    std::vector<std::size_t> Members;   //!< indices into the parameter list, in declaration order
    Tensor Gather;                      //!< (world, Elements) BF16
    std::array<Tensor, 2> Local;        //!< (Elements) BF16, alternating between consecutive shards

    [[nodiscard]] long num_shards(int world_size) const;
};

//! Hooks into the step state machine, called on the host in issue order.
class MuonObserver {
public:
    virtual ~MuonObserver() = default;
    virtual void on_gather_issued(std::size_t group, long shard) {}
    virtual void on_applied(std::size_t group, long shard) {}
};

class Muon {
public:
    //! Returns the gradient of a parameter, or nullptr if it has none.
    using GradientLookup = std::function<Tensor*(const ParameterSpec& param)>;

    /**
     * @param params Parameters to optimize; names must be unique.
     * @param hyper_sets Hyper-parameter sets referenced by ParameterSpec::HyperSet.
     * @param comm Collective provider; its rank/world determine shard ownership.
     * @param allocator Owner of all optimizer buffers.
     * @param stream Compute stream on which all optimizer work is enqueued.
     * @param coefficients Name of the Newton-Schulz coefficient table.
     * @param power_iterations Iterations of the spectral-norm estimate.
     * @param seed Base seed of the power iteration.
     *
     * @throws ShapeError For parameters that are not FP32 matrices.
     * @throws std::invalid_argument For duplicate names, unknown hyper sets or coefficient tables.
     */
    Muon(std::vector<ParameterSpec> params, std::vector<HyperParameters> hyper_sets, ICollective& comm,
         TensorAllocator& allocator, cudaStream_t stream, const std::string& coefficients = "capped",
         int power_iterations = 26, std::uint64_t seed = 0x5eed);
    ~Muon();

    Muon(const Muon&) = delete;
    Muon& operator=(const Muon&) = delete;

    /**
     * @brief Run one optimizer step over every group.
     *
     * Only gradients of parameters owned by this rank are looked up. All ranks have to call
     * step() with the same arguments.
     *
     * @throws UninitializedGradientError If an owned parameter has no gradient.
     * @throws ShapeError If a gradient's shape differs from its parameter.
     * @throws CommunicationError If a gather fails.
     */
    void step(const StepParameters& params, const GradientLookup& gradients);

    //! Number of non-finite spectral-norm estimates so far. Synchronizes the optimizer stream.
    [[nodiscard]] int degenerate_count() const;

    //! Rank computing the orthogonalized update (and holding the momentum) of @p name.
    [[nodiscard]] int owner(const std::string& name) const;
    [[nodiscard]] bool owns(const std::string& name) const { return owner(name) == mRank; }

    [[nodiscard]] const std::vector<ParameterGroup>& groups() const { return mGroups; }
    [[nodiscard]] const std::vector<ParameterSpec>& parameters() const { return mParams; }

    //! The orthogonalizer, sized for every parameter of this optimizer.
    [[nodiscard]] NewtonSchulz& orthogonalizer() { return *mOrthogonalizer; }

    [[nodiscard]] MomentumStore& momentum() { return mMomentum; }
    [[nodiscard]] const MomentumStore& momentum() const { return mMomentum; }

    //! Observer is not owned; pass nullptr to detach.
    void set_observer(MuonObserver* observer) { mObserver = observer; }

private:
    void compute_shard(ParameterGroup& group, long shard, const StepParameters& params, const GradientLookup& gradients);
    void apply_shard(std::size_t group_index, long shard, Tensor& gathered, const StepParameters& params);

    std::vector<ParameterSpec> mParams;
    std::vector<HyperParameters> mHyperSets;
    std::vector<ParameterGroup> mGroups;
    std::unordered_map<std::string, int> mOwners;

    ICollective* mComm;
    int mRank;
    int mWorld;
    cudaStream_t mStream;
    std::uint64_t mSeed;

    std::unique_ptr<NewtonSchulz> mOrthogonalizer;
    std::unique_ptr<SpectralNormEstimator> mSpectralNorm;
    MomentumStore mMomentum;

    Tensor mSigma;              //!< FP32 scalar, power-iteration result
    Tensor mDegenerateCount;    //!< INT32 scalar

    MuonObserver* mObserver = nullptr;
};

} // namespace optimizers

#endif // SPECTRON_SRC_RUNTIME_OPTIMIZERS_MUON_H
