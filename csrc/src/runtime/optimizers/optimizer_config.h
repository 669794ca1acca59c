// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H

#include <string>

namespace optimizers {

/**
 * @brief Hyper-parameters of the hybrid Muon / AdamW setup.
 *
 * Hidden matrices (and optionally the LM head) are optimized by Muon; embeddings
 * (and the LM head otherwise) by AdamW.
 */
struct OptimizerConfig {
    // Muon, hidden matrices
    float muon_lr = 0.05f;
    float muon_momentum = 0.95f;
    bool nesterov = true;
    float w_max = 8.0f;

    // LM head
    bool lm_head_muon = true;
    float lm_head_lr = 0.005f;
    float lm_head_w_max = 8.0f;   // equivalent to inverse temperature

    // Embeddings
    float emb_w_max = 1.0f;

    // AdamW
    float adam_lr = 0.1f;
    float adam_beta1 = 0.8f;
    float adam_beta2 = 0.95f;
    float adam_epsilon = 1e-10f;
    float adam_weight_decay = 0.0f;

    // Newton-Schulz coefficient table, see coefficient_table_from_str()
    std::string ns_coefficients = "capped";

    // Power-iteration steps for the spectral-norm estimate
    int power_iterations = 26;
};

} // namespace optimizers

#endif // SPECTRON_SRC_RUNTIME_OPTIMIZERS_OPTIMIZER_CONFIG_H
