// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "spectral_norm.h"

#include <stdexcept>

#include <fmt/core.h>

#include "errors.h"
#include "kernels/kernels.h"
#include "utilities/allocator.h"
#include "utilities/utils.h"

namespace optimizers {

namespace {
constexpr float kPowerIterationEpsilon = 1e-8f;
}

SpectralNormEstimator::SpectralNormEstimator(long max_dim, TensorAllocator& allocator, int iterations) :
    mMaxDim(max_dim), mIterations(iterations)
{
    if (max_dim <= 0 || iterations <= 0) {
        throw std::invalid_argument(fmt::format("SpectralNormEstimator: invalid size {} or iteration count {}", max_dim, iterations));
    }
    mU = allocator.allocate(ETensorDType::FP32, "power_iter_u", {max_dim});
    mV = allocator.allocate(ETensorDType::FP32, "power_iter_v", {max_dim});
    mSigma = allocator.allocate(ETensorDType::FP32, "power_iter_sigma", {1});
    mHandle = create_cublas_handle();
}

SpectralNormEstimator::~SpectralNormEstimator() {
    destroy_cublas_handle(mHandle);
}

void SpectralNormEstimator::estimate(const Tensor& M, std::uint64_t seed, float* d_sigma, cudaStream_t stream) {
    NVTX_RANGE_FN();
    if (M.nelem() == 0) {
        throw ShapeError(fmt::format("SpectralNormEstimator: empty matrix of shape {}", M.shape_str()));
    }
    const long rows = M.rows();
    const long cols = M.cols();
    if (rows > mMaxDim || cols > mMaxDim) {
        throw ShapeError(fmt::format("SpectralNormEstimator: matrix {} exceeds workspace dimension {}", M.shape_str(), mMaxDim));
    }

    // A row-major (rows x cols) matrix is a column-major (cols x rows) one for cuBLAS,
    // so u^T M is a plain gemv and v M^T a transposed one.
    const int out_dim = narrow<int>(rows);
    const int in_dim = narrow<int>(cols);
    const float* m = M.get<float>();
    float* u = mU.get<float>();
    float* v = mV.get<float>();

    fill_normal(u, out_dim, 1.f, seed, stream);
    for (int i = 0; i < mIterations; ++i) {
        gemv(v, m, u, in_dim, out_dim, false, mHandle, stream);
        gemv(u, m, v, in_dim, out_dim, true, mHandle, stream);
        normalize_vector(u, nullptr, out_dim, kPowerIterationEpsilon, stream);
    }
    gemv(v, m, u, in_dim, out_dim, false, mHandle, stream);
    vector_norm(d_sigma, v, in_dim, stream);
}

float SpectralNormEstimator::estimate_host(const Tensor& M, std::uint64_t seed, cudaStream_t stream) {
    estimate(M, seed, mSigma.get<float>(), stream);
    float sigma = 0.f;
    CUDA_CHECK(cudaMemcpyAsync(&sigma, mSigma.Data, sizeof(float), cudaMemcpyDeviceToHost, stream));
    CUDA_CHECK(cudaStreamSynchronize(stream));
    return sigma;
}

} // namespace optimizers
