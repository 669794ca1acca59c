// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_TENSOR_CONTAINER_H
#define SPECTRON_SRC_UTILITIES_TENSOR_CONTAINER_H

#include <functional>
#include <string>

struct Tensor;

//! Anything that exposes a set of named tensors (model weights, optimizer state)
//! for serialization.
class ITensorContainer {
public:
    virtual ~ITensorContainer() = default;
    virtual void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) = 0;
};

#endif //SPECTRON_SRC_UTILITIES_TENSOR_CONTAINER_H
