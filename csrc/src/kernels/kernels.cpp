// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "kernels.h"

#include <cstdint>
#include <stdexcept>

#include "utilities/tensor.h"

/**
 * @brief Looks up the embedding rows for a sequence of token ids.
 *
 * @param out [out] Activations of shape (T, C). Only FP32 is supported.
 * @param inp [in] Token ids of shape (T), INT32.
 * @param wte [in] Embedding table of shape (V, C).
 * @param T Sequence length.
 * @param C Model dimension.
 * @param stream CUDA stream on which to run.
 *
 * @throws std::runtime_error If the tensors are not FP32 / INT32.
 */
void encoder_forward(Tensor& out, const Tensor& inp, const Tensor& wte, int T, int C, cudaStream_t stream) {
    if(out.DType == ETensorDType::FP32) {
        encoder_forward(out.get<float>(), inp.get<std::int32_t>(), wte.get<float>(), T, C, stream);
    } else {
        throw std::runtime_error("encoder_forward: unsupported dtype");
    }
}

/**
 * @brief Scatter-adds the activation gradients into the embedding gradient.
 *
 * The embedding gradient is accumulated with atomics; the caller clears it first.
 */
void encoder_backward(Tensor& dwte, const Tensor& dout, const Tensor& inp, int T, int C, cudaStream_t stream) {
    if(dwte.DType == ETensorDType::FP32) {
        encoder_backward(dwte.get<float>(), dout.get<float>(), inp.get<std::int32_t>(), T, C, stream);
    } else {
        throw std::runtime_error("encoder_backward: unsupported dtype");
    }
}
