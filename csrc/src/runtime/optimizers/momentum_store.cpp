// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "momentum_store.h"

#include <stdexcept>

#include <fmt/core.h>

#include "errors.h"
#include "kernels/kernels.h"
#include "utilities/allocator.h"

namespace optimizers {

MomentumStore::MomentumStore(TensorAllocator& allocator) : mAllocator(&allocator) {
}

Tensor& MomentumStore::get_or_create(const std::string& name, const std::vector<long>& shape, cudaStream_t stream) {
    auto found = mBuffers.find(name);
    if (found != mBuffers.end()) {
        return found->second;
    }
    std::string buffer_name = "momentum." + name;
    Tensor buffer = mAllocator->allocate(ETensorDType::FP32, buffer_name.c_str(), shape);
    fill_zero(buffer, stream);
    return mBuffers.emplace(name, buffer).first->second;
}

Tensor MomentumStore::update(const std::string& name, Tensor& grad, float momentum, bool nesterov, cudaStream_t stream) {
    if (grad.DType != ETensorDType::FP32) {
        throw ShapeError(fmt::format("MomentumStore: gradient of '{}' must be FP32, got {}", name, dtype_to_str(grad.DType)));
    }

    Tensor& buf = get_or_create(name, std::vector<long>(grad.Sizes.begin(), grad.Sizes.begin() + grad.Rank), stream);
    if (!buf.same_shape(grad)) {
        throw ShapeError(fmt::format("MomentumStore: gradient of '{}' has shape {}, buffer has {}",
                                     name, grad.shape_str(), buf.shape_str()));
    }

    momentum_update(buf.get<float>(), grad.get<float>(), momentum, nesterov, static_cast<long>(grad.nelem()), stream);
    return nesterov ? grad : buf;
}

bool MomentumStore::contains(const std::string& name) const {
    return mBuffers.contains(name);
}

const Tensor& MomentumStore::buffer(const std::string& name) const {
    auto found = mBuffers.find(name);
    if (found == mBuffers.end()) {
        throw std::out_of_range(fmt::format("MomentumStore: no buffer for '{}'", name));
    }
    return found->second;
}

void MomentumStore::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    for (const auto& [name, buffer] : mBuffers) {
        callback(name, buffer);
    }
}

} // namespace optimizers
