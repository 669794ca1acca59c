// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "allocator.h"

#include <algorithm>
#include <cstdio>
#include <functional>
#include <map>
#include <numeric>
#include <stdexcept>

#include <cuda_runtime.h>
#include <fmt/core.h>
#include <fmt/ranges.h>

#include "utils.h"

TensorAllocator::TensorAllocator(TensorAllocator&& other) noexcept
    : mAllocations(std::move(other.mAllocations)), mContext(std::move(other.mContext)) {
    other.mAllocations.clear();
}

TensorAllocator& TensorAllocator::operator=(TensorAllocator&& other) noexcept {
    if (this != &other) {
        TensorAllocator dying(std::move(*this));
        mAllocations = std::move(other.mAllocations);
        mContext = std::move(other.mContext);
        other.mAllocations.clear();
    }
    return *this;
}

namespace {

void warn_cuda(cudaError_t status, const char* what, const std::string& name) {
    fmt::print(stderr, "WARNING: CUDA error while {} {}: {}\n", what, name, cudaGetErrorString(status));
    std::fflush(stderr);
    (void)cudaGetLastError();
}

} // namespace

TensorAllocator::~TensorAllocator() noexcept {
    if (mAllocations.empty()) {
        return;
    }

    // kernels may still be reading from buffers we are about to free
    const cudaError_t sync = cudaDeviceSynchronize();
    if (sync != cudaSuccess) {
        warn_cuda(sync, "synchronizing before", "freeing allocations");
    }

    for (auto& alloc : mAllocations) {
        const cudaError_t status = alloc.Kind == EAllocationType::ON_DEVICE ? cudaFree(alloc.Pointer) : cudaFreeHost(alloc.Pointer);
        if (status != cudaSuccess) {
            warn_cuda(status, "freeing", alloc.Name);
        }
    }
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::initializer_list<long>& shape) {
    return allocate_impl(dtype, name, kind, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::vector<long>& shape) {
    return allocate_impl(dtype, name, kind, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, const std::initializer_list<long>& shape) {
    return allocate_impl(dtype, name, EAllocationType::ON_DEVICE, shape);
}

Tensor TensorAllocator::allocate(ETensorDType dtype, const char* name, const std::vector<long>& shape) {
    return allocate_impl(dtype, name, EAllocationType::ON_DEVICE, shape);
}

/**
 * @brief Allocate storage for a tensor and record it for cleanup.
 *
 * Zero-element tensors still receive a one-byte allocation so that Data is never null.
 *
 * @throws std::runtime_error If the rank exceeds MAX_TENSOR_DIM, or on device OOM (after
 *         printing the per-context usage to stderr).
 * @throws cuda_error On any other CUDA failure.
 */
template<typename Container>
Tensor TensorAllocator::allocate_impl(ETensorDType dtype, const char* name, EAllocationType kind, const Container& shape) {
    const std::string label = name ? name : "<unnamed>";
    if (shape.size() > MAX_TENSOR_DIM) {
        throw std::runtime_error(fmt::format("Tensor {} has rank {}, at most {} is supported", label, shape.size(), MAX_TENSOR_DIM));
    }

    const long elements = std::accumulate(std::begin(shape), std::end(shape), 1l, std::multiplies<>());
    const std::size_t bytes = std::max<std::size_t>(static_cast<std::size_t>(elements) * get_dtype_size(dtype), 1);

    int device = -1;
    std::byte* ptr = nullptr;
    try {
        if (kind == EAllocationType::ON_DEVICE) {
            CUDA_CHECK(cudaGetDevice(&device));
            CUDA_CHECK(cudaMalloc(reinterpret_cast<void**>(&ptr), bytes));
        } else {
            CUDA_CHECK(cudaHostAlloc(reinterpret_cast<void**>(&ptr), bytes, cudaHostAllocMapped));
        }
    } catch (const cuda_error& error) {
        if (error.code != cudaErrorMemoryAllocation) {
            throw;
        }
        (void)cudaGetLastError();
        report_oom(label);
        throw std::runtime_error(fmt::format("CUDA OOM when allocating tensor {} of shape [{}] with dtype {} in context {}. "
                                             "Try reducing --seq-len or --model-dim.",
                                             label, fmt::join(shape, ", "), dtype_to_str(dtype),
                                             mContext.empty() ? "<none>" : mContext));
    }
    mAllocations.push_back(sAllocationData{kind, ptr, bytes, label, mContext});
    return Tensor::from_pointer(ptr, device, dtype, shape);
}

std::size_t TensorAllocator::device_bytes() const {
    std::size_t total = 0;
    for (const auto& alloc : mAllocations) {
        if (alloc.Kind == EAllocationType::ON_DEVICE) {
            total += alloc.Size;
        }
    }
    return total;
}

std::vector<std::pair<std::string, std::size_t>> TensorAllocator::get_context_stats() const {
    std::map<std::string, std::size_t> per_context;
    for (const auto& alloc : mAllocations) {
        if (alloc.Kind == EAllocationType::ON_DEVICE) {
            per_context[alloc.Context.empty() ? "<none>" : alloc.Context] += alloc.Size;
        }
    }
    std::vector<std::pair<std::string, std::size_t>> result(per_context.begin(), per_context.end());
    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    return result;
}

void TensorAllocator::report_oom(const std::string& name) const {
    fmt::print(stderr, "\n=== device allocations before OOM on {} ({} MiB) ===\n", name, device_bytes() / 1024 / 1024);
    for (const auto& [ctx, bytes] : get_context_stats()) {
        fmt::print(stderr, "  [{}] {} MiB\n", ctx, bytes / 1024 / 1024);
    }
    std::fflush(stderr);
}

TensorAllocator::ContextScope::ContextScope(std::string name, TensorAllocator* allocator) :
    mName(std::move(name)), mParent(allocator->mContext), mAllocator(allocator) {
    allocator->mContext = mName;
}

TensorAllocator::ContextScope::ContextScope(ContextScope&& other) noexcept
    : mName(std::move(other.mName)), mParent(std::move(other.mParent)), mAllocator(other.mAllocator) {
    other.mAllocator = nullptr;
}

TensorAllocator::ContextScope::~ContextScope() noexcept {
    if (!mAllocator) {
        return;
    }
    if (mAllocator->mContext != mName) {
        fmt::print(stderr, "WARNING: allocator context '{}' closed while '{}' was active\n", mName, mAllocator->mContext);
    }
    mAllocator->mContext = mParent;
}
