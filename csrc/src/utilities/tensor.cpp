// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <cstring>

#include <cuda_runtime.h>
#include <fmt/core.h>
#include <fmt/ranges.h>

Tensor as_matrix(const Tensor& src) {
    if (src.Rank < 2) {
        return src;
    }
    Tensor dst = src;
    dst.Sizes[1] = src.cols();
    for (int i = 2; i < MAX_TENSOR_DIM; ++i)
        dst.Sizes[i] = 1;
    dst.Rank = 2;
    return dst;
}

std::string Tensor::shape_str() const {
    return fmt::format("({})", fmt::join(Sizes.begin(), Sizes.begin() + Rank, ", "));
}

void Tensor::check_dtype(ETensorDType expected) const {
    if (expected != DType) {
        throw std::logic_error(fmt::format("DType mismatch: expected {}, got {}", dtype_to_str(expected), dtype_to_str(DType)));
    }
}

/**
 * @brief Asynchronously fill a tensor's buffer with zeros.
 *
 * For device memory, uses cudaMemsetAsync with the provided stream.
 * For host/pinned memory (Device == -1), uses memset since cudaMemsetAsync
 * doesn't work on host memory.
 */
void fill_zero(Tensor& dst, cudaStream_t stream) {
    if (!dst.Data || dst.bytes() == 0) return;

    if (dst.Device == -1) {
        std::memset(dst.Data, 0, dst.bytes());
        return;
    }

    CUDA_CHECK(cudaMemsetAsync(dst.Data, 0, dst.bytes(), stream));
}
