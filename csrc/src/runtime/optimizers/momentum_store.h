// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_RUNTIME_OPTIMIZERS_MOMENTUM_STORE_H
#define SPECTRON_SRC_RUNTIME_OPTIMIZERS_MOMENTUM_STORE_H

#include <map>
#include <string>
#include <vector>

#include <cuda_runtime.h>

#include "utilities/tensor.h"
#include "utilities/tensor_container.h"

class TensorAllocator;

namespace optimizers {

/**
 * @brief FP32 exponential-moving-average buffers, one per parameter name.
 *
 * Buffers are created (zero-filled) the first time a parameter is updated, and only on the rank
 * that owns the parameter. Iteration order is by name, so the serialized state does not depend
 * on the order in which parameters were first touched.
 */
class MomentumStore : public ITensorContainer {
public:
    explicit MomentumStore(TensorAllocator& allocator);

    /**
     * @brief Blend @p grad into the buffer of @p name and return the effective update.
     *
     * buf = buf + (1 - momentum) * (grad - buf). With @p nesterov the lookahead
     * grad + momentum * (buf - grad) is written into @p grad, which is returned;
     * otherwise the buffer itself is returned.
     *
     * @throws ShapeError If @p grad is not FP32 or disagrees in shape with an existing buffer.
     */
    Tensor update(const std::string& name, Tensor& grad, float momentum, bool nesterov, cudaStream_t stream);

    //! Buffer for @p name, zero-filled on @p stream if it does not exist yet.
    Tensor& get_or_create(const std::string& name, const std::vector<long>& shape, cudaStream_t stream);

    [[nodiscard]] bool contains(const std::string& name) const;

    //! @throws std::out_of_range If there is no buffer for @p name.
    [[nodiscard]] const Tensor& buffer(const std::string& name) const;

    [[nodiscard]] std::size_t size() const { return mBuffers.size(); }

    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;

private:
    TensorAllocator* mAllocator;
    std::map<std::string, Tensor> mBuffers;
};

} // namespace optimizers

#endif // SPECTRON_SRC_RUNTIME_OPTIMIZERS_MOMENTUM_STORE_H
