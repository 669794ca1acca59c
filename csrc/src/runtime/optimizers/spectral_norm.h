// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_SPECTRAL_NORM_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_SPECTRAL_NORM_H

#include <cstdint>

#include <cuda_runtime.h>

#include "utilities/tensor.h"

typedef struct cublasContext* cublasHandle_t;
class TensorAllocator;

namespace optimizers {

/**
 * @brief Power-iteration estimate of the largest singular value of an FP32 matrix.
 *
 * For M of shape (out, in), starts from a normal random u of length out and repeats
 *   v = u^T M;  u = v M^T;  u /= (||u|| + 1e-8)
 * for a fixed number of iterations, then returns ||u^T M||.
 * The start vector depends only on the seed, so the estimate is deterministic given the seed.
 */
class SpectralNormEstimator {
public:
    static constexpr int kDefaultIterations = 26;

    SpectralNormEstimator(long max_dim, TensorAllocator& allocator, int iterations = kDefaultIterations);
    ~SpectralNormEstimator();

    SpectralNormEstimator(const SpectralNormEstimator&) = delete;
    SpectralNormEstimator& operator=(const SpectralNormEstimator&) = delete;

    /**
     * @brief Enqueue the estimate for @p M on @p stream.
     *
     * @param M FP32 matrix; trailing dimensions are flattened into columns.
     * @param seed Seed of the random start vector.
     * @param d_sigma [out] Device pointer receiving the estimate.
     *
     * @throws ShapeError If @p M is empty or either dimension exceeds the workspace.
     */
    void estimate(const Tensor& M, std::uint64_t seed, float* d_sigma, cudaStream_t stream);

    //! Synchronizes @p stream and returns the estimate on the host.
    float estimate_host(const Tensor& M, std::uint64_t seed, cudaStream_t stream);

    [[nodiscard]] int iterations() const { return mIterations; }

private:
    long mMaxDim;
    int mIterations;
    cublasHandle_t mHandle = nullptr;

    Tensor mU;
    Tensor mV;
    Tensor mSigma;
};

} // namespace optimizers

#endif // SPECTRON_SRC_RUNTIME_OPTIMIZERS_SPECTRAL_NORM_H
