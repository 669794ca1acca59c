// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Full-precision AdamW optimizer kernel (FP32 state).

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_ADAMW_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_ADAMW_H

#include <cmath>
#include <cstddef>
#include <cuda_runtime.h>

namespace optimizers {

void adamw_update(float* param, const float* grad, float* m, float* v, std::size_t n,
                  float lr, float beta1, float beta2, float beta1_correction, float beta2_correction,
                  float epsilon, float weight_decay, cudaStream_t stream);

//! Bias-correction denominator 1 - beta^t for a 1-based step t.
inline float adamw_bias_correction(float beta, int t) {
    return 1.f - std::pow(beta, static_cast<float>(t));
}

}  // namespace optimizers

#endif  // SPECTRON_SRC_RUNTIME_OPTIMIZERS_ADAMW_H
