// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Newton-Schulz orthogonalization of update matrices.
// Each step computes
//   A = X @ X.T
//   B = b*A + c*(A @ A)
//   X = a*X + B @ X
// on the wide orientation of the input, after normalizing it by its Frobenius norm.

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_NEWTON_SCHULZ_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_NEWTON_SCHULZ_H

#include <string>
#include <string_view>
#include <vector>

#include <cuda_runtime.h>

#include "utilities/tensor.h"

typedef struct cublasContext* cublasHandle_t;
class TensorAllocator;

namespace optimizers {

//! Coefficients (a, b, c) of one quintic iteration step.
struct NSCoefficients {
    float A;
    float B;
    float C;
};

struct CoefficientTable {
    std::string Name;
    std::vector<NSCoefficients> Steps;
};

/**
 * @brief Look up a built-in coefficient table.
 *
 * - "capped": five tuned steps that keep singular values within a few percent of 1 (default)
 * - "ns5": five repetitions of the classic (3.4445, -4.7750, 2.0315)
 * - "polar-express": the Polar Express schedule, https://arxiv.org/pdf/2505.16932
 *
 * @throws std::invalid_argument For an unknown name.
 */
CoefficientTable coefficient_table_from_str(std::string_view name);

//! Names accepted by coefficient_table_from_str().
std::vector<std::string> coefficient_table_names();

/**
 * @brief Orthogonalizer with a preallocated BF16 workspace.
 *
 * The workspace holds two copies of the largest matrix plus two (k x k) Gram buffers,
 * where k is the largest smaller dimension of any matrix that will be orthogonalized.
 */
class NewtonSchulz {
public:
    NewtonSchulz(CoefficientTable table, long max_elements, long max_inner_dim, TensorAllocator& allocator);
    ~NewtonSchulz();

    NewtonSchulz(const NewtonSchulz&) = delete;
    NewtonSchulz& operator=(const NewtonSchulz&) = delete;

    /**
     * @brief Orthogonalize @p G into @p out (BF16, same element count as @p G).
     *
     * @p G may be FP32 or BF16 and has to be rank 2. The result keeps the orientation of @p G.
     *
     * @throws ShapeError If @p G is not rank 2, or @p out has a different element count.
     * @throws std::logic_error If the dtypes are unsupported or @p G exceeds the workspace.
     */
    void orthogonalize(const Tensor& G, Tensor& out, cudaStream_t stream);

    [[nodiscard]] const CoefficientTable& table() const { return mTable; }
    [[nodiscard]] long max_elements() const { return mMaxElements; }
    [[nodiscard]] long max_inner_dim() const { return mMaxInnerDim; }

private:
    CoefficientTable mTable;
    long mMaxElements;
    long mMaxInnerDim;

    cublasHandle_t mHandle = nullptr;

    Tensor mX;
    Tensor mY;
    Tensor mGram;
    Tensor mPoly;
    Tensor mNormSq;
};

} // namespace optimizers

#endif // SPECTRON_SRC_RUNTIME_OPTIMIZERS_NEWTON_SCHULZ_H
