// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "newton_schulz.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <cuda_bf16.h>
#include <fmt/core.h>

#include "errors.h"
#include "kernels/kernels.h"
#include "utilities/allocator.h"
#include "utilities/utils.h"

namespace optimizers {

namespace {

constexpr float kNormEpsilon = 1e-7f;

// Singular values above 1% of the Frobenius norm end up in [0.977, 1.032]; tiny ones may overshoot to ~1.15.
const std::vector<NSCoefficients> kCappedSteps = {
    {4.0848f, -6.8946f, 2.9270f},
    {3.9505f, -6.3029f, 2.6377f},
    {3.7418f, -5.5913f, 2.3037f},
    {2.8769f, -3.1427f, 1.2046f},
    {2.8366f, -3.0525f, 1.2012f},
};

const std::vector<NSCoefficients> kNS5Steps(5, NSCoefficients{3.4445f, -4.7750f, 2.0315f});

// num_iters=5, safety_factor=2e-2, cushion=2
const std::vector<NSCoefficients> kPolarExpressSteps = {
    {8.156554524902461f, -22.48329292557795f, 15.878769915207462f},
    {4.042929935166739f, -2.808917465908714f, 0.5000178451051316f},
    {3.8916678022926607f, -2.772484153217685f, 0.5060648178503393f},
    {3.285753657755655f, -2.3681294933425376f, 0.46449024233003106f},
    {2.3465413258596377f, -1.7097828382687081f, 0.42323551169305323f},
};

} // namespace

CoefficientTable coefficient_table_from_str(std::string_view name) {
    if (iequals(name, "capped")) {
        return {"capped", kCappedSteps};
    } else if (iequals(name, "ns5")) {
        return {"ns5", kNS5Steps};
    } else if (iequals(name, "polar-express") || iequals(name, "polar_express")) {
        return {"polar-express", kPolarExpressSteps};
    }
    throw std::invalid_argument(fmt::format("Unknown Newton-Schulz coefficient table '{}'", name));
}

std::vector<std::string> coefficient_table_names() {
    return {"capped", "ns5", "polar-express"};
}

NewtonSchulz::NewtonSchulz(CoefficientTable table, long max_elements, long max_inner_dim, TensorAllocator& allocator) :
    mTable(std::move(table)), mMaxElements(max_elements), mMaxInnerDim(max_inner_dim)
{
    if (mTable.Steps.empty()) {
        throw std::invalid_argument(fmt::format("Newton-Schulz coefficient table '{}' is empty", mTable.Name));
    }
    if (max_elements <= 0 || max_inner_dim <= 0) {
        throw std::invalid_argument(fmt::format("NewtonSchulz: invalid workspace size {} / {}", max_elements, max_inner_dim));
    }

    mX = allocator.allocate(ETensorDType::BF16, "ns_x", {max_elements});
    mY = allocator.allocate(ETensorDType::BF16, "ns_y", {max_elements});
    mGram = allocator.allocate(ETensorDType::BF16, "ns_gram", {max_inner_dim, max_inner_dim});
    mPoly = allocator.allocate(ETensorDType::BF16, "ns_poly", {max_inner_dim, max_inner_dim});
    mNormSq = allocator.allocate(ETensorDType::FP32, "ns_norm", {1});
    mHandle = create_cublas_handle();
}

NewtonSchulz::~NewtonSchulz() {
    destroy_cublas_handle(mHandle);
}

/**
 * @brief Runs the fixed coefficient schedule on the wide orientation of @p G.
 *
 * With X row-major (m x n), m <= n, cuBLAS sees X as a column-major (n x m) matrix with
 * leading dimension n. The three products of a step are then
 *   Gram = X^T X           (TN, m x m)
 *   Poly = c*Gram*Gram + b*Gram
 *   Y    = X*Poly + a*X    (NN, n x m)
 * where the symmetry of Gram and Poly makes the column-major results equal to the row-major ones.
 */
void NewtonSchulz::orthogonalize(const Tensor& G, Tensor& out, cudaStream_t stream) {
    NVTX_RANGE_FN();
    if (G.Rank != 2) {
        throw ShapeError(fmt::format("orthogonalize: expected a rank-2 input, got shape {}", G.shape_str()));
    }
    if (out.nelem() != G.nelem()) {
        throw ShapeError(fmt::format("orthogonalize: output shape {} does not match input shape {}", out.shape_str(), G.shape_str()));
    }
    if (out.DType != ETensorDType::BF16) {
        throw std::logic_error(fmt::format("orthogonalize: output must be BF16, got {}", dtype_to_str(out.DType)));
    }
    if (G.DType != ETensorDType::BF16 && G.DType != ETensorDType::FP32) {
        throw std::logic_error(fmt::format("orthogonalize: unsupported input dtype {}", dtype_to_str(G.DType)));
    }

    const int rows = narrow<int>(G.Sizes[0]);
    const int cols = narrow<int>(G.Sizes[1]);
    const int m = std::min(rows, cols);
    const int n = std::max(rows, cols);
    const long nelem = static_cast<long>(G.nelem());
    if (nelem > mMaxElements || m > mMaxInnerDim) {
        throw std::logic_error(fmt::format("orthogonalize: input {} exceeds workspace ({} elements, inner dim {})",
                                           G.shape_str(), mMaxElements, mMaxInnerDim));
    }
    if (nelem == 0) {
        return;
    }

    const bool transposed = rows > cols;
    auto* x = mX.get<nv_bfloat16>();
    auto* y = mY.get<nv_bfloat16>();
    auto* gram = mGram.get<nv_bfloat16>();
    auto* poly = mPoly.get<nv_bfloat16>();
    float* norm_sq = mNormSq.get<float>();

    // load G into X in wide orientation
    nv_bfloat16* staging = transposed ? y : x;
    if (G.DType == ETensorDType::FP32) {
        convert_to_bf16(staging, G.get<float>(), nelem, stream);
    } else {
        CUDA_CHECK(cudaMemcpyAsync(staging, G.Data, G.bytes(), cudaMemcpyDeviceToDevice, stream));
    }
    if (transposed) {
        transpose(x, y, rows, cols, stream);
    }

    sum_squares(norm_sq, x, nelem, stream);
    scale_by_inverse_norm(x, norm_sq, kNormEpsilon, nelem, stream);

    const std::size_t gram_bytes = static_cast<std::size_t>(m) * m * sizeof(nv_bfloat16);
    const std::size_t x_bytes = static_cast<std::size_t>(nelem) * sizeof(nv_bfloat16);
    for (const auto& [a, b, c] : mTable.Steps) {
        gemm_bf16(gram, x, x, m, m, n, n, n, m, EMMTranspose::TN, 1.f, 0.f, mHandle, stream);
        CUDA_CHECK(cudaMemcpyAsync(poly, gram, gram_bytes, cudaMemcpyDeviceToDevice, stream));
        gemm_bf16(poly, gram, gram, m, m, m, m, m, m, EMMTranspose::NN, c, b, mHandle, stream);
        CUDA_CHECK(cudaMemcpyAsync(y, x, x_bytes, cudaMemcpyDeviceToDevice, stream));
        gemm_bf16(y, x, poly, n, m, m, n, m, n, EMMTranspose::NN, 1.f, a, mHandle, stream);
        std::swap(x, y);
    }

    if (transposed) {
        transpose(out.get<nv_bfloat16>(), x, m, n, stream);
    } else {
        CUDA_CHECK(cudaMemcpyAsync(out.Data, x, x_bytes, cudaMemcpyDeviceToDevice, stream));
    }
}

} // namespace optimizers
