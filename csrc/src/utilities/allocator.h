// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_ALLOCATOR_H
#define SPECTRON_SRC_UTILITIES_ALLOCATOR_H

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "tensor.h"

enum class EAllocationType : int {
    ON_DEVICE,  // cudaMalloc
    PINNED      // cudaHostAlloc(Mapped), used for host staging of batches
};

/**
 * @brief Owns every buffer it hands out.
 *
 * Tensors returned by allocate() are non-owning views that stay valid until the allocator
 * is destroyed. Each allocation is tagged with the context that was active when it was made
 * (see with_context()), which is what get_context_stats() aggregates over.
 */
class TensorAllocator {
public:
    TensorAllocator() = default;
    ~TensorAllocator() noexcept;
    TensorAllocator(TensorAllocator&&) noexcept;
    TensorAllocator& operator=(TensorAllocator&&) noexcept;
    TensorAllocator(const TensorAllocator&) = delete;
    TensorAllocator& operator=(const TensorAllocator&) = delete;

    Tensor allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::vector<long>& shape);
    Tensor allocate(ETensorDType dtype, const char* name, EAllocationType kind, const std::initializer_list<long>& shape);

    Tensor allocate(ETensorDType dtype, const char* name, const std::vector<long>& shape);
    Tensor allocate(ETensorDType dtype, const char* name, const std::initializer_list<long>& shape);

    [[nodiscard]] std::size_t device_bytes() const;

    //! Restores the previous context when destroyed.
    class ContextScope {
    public:
        ContextScope(std::string name, TensorAllocator* allocator);
        ContextScope(ContextScope&& other) noexcept;
        ContextScope(const ContextScope&) = delete;
        ContextScope& operator=(const ContextScope&) = delete;
        ~ContextScope() noexcept;
    private:
        std::string mName;
        std::string mParent;
        TensorAllocator* mAllocator;
    };

    [[nodiscard]] ContextScope with_context(const std::string& ctx) { return ContextScope(ctx, this); }

    /**
     * @brief Device bytes per allocation context, largest first.
     *
     * Allocations made outside any context are reported under "<none>".
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::size_t>> get_context_stats() const;

private:
    template<typename Container>
    Tensor allocate_impl(ETensorDType dtype, const char* name, EAllocationType kind, const Container& shape);

    void report_oom(const std::string& name) const;

    struct sAllocationData {
        EAllocationType Kind;
        std::byte* Pointer;
        std::size_t Size;
        std::string Name;
        std::string Context;
    };

    std::vector<sAllocationData> mAllocations;
    std::string mContext;
};

#endif //SPECTRON_SRC_UTILITIES_ALLOCATOR_H
