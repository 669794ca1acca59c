// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Error taxonomy of the optimizer core. All of these are fatal for the step that raises them;
// a degenerate spectral-norm estimate is handled on the device and only counted.

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_ERRORS_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_ERRORS_H

#include <stdexcept>
#include <string>

namespace optimizers {

//! Parameter/gradient shape mismatch, non-2D input to the orthogonalizer, or a parameter
//! whose element count does not match its group.
class ShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! An optimizer step reached a parameter (owned by this rank) that has no gradient.
class UninitializedGradientError : public std::runtime_error {
public:
    explicit UninitializedGradientError(const std::string& param_name)
        : std::runtime_error("optimizer step on parameter '" + param_name + "' without a gradient"),
          mParamName(param_name) {}

    [[nodiscard]] const std::string& param_name() const { return mParamName; }
private:
    std::string mParamName;
};

//! A collective operation failed (NCCL error, peer failure, async abort).
class CommunicationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace optimizers

#endif //SPECTRON_SRC_RUNTIME_OPTIMIZERS_ERRORS_H
