// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_TENSOR_H
#define SPECTRON_SRC_UTILITIES_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous view on memory that is associated
//! with a specific data type and shape. It does not own its memory.
struct Tensor {
    ETensorDType DType;
    std::array<long, MAX_TENSOR_DIM> Sizes;
    std::byte* Data = nullptr;
    int Rank = 0;
    int Device = -1;

    [[nodiscard]] constexpr std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }

    //! Number of rows when the tensor is viewed as a matrix (leading dimension).
    [[nodiscard]] long rows() const { return Rank == 0 ? 1 : Sizes[0]; }
    //! Number of columns when all trailing dimensions are flattened.
    [[nodiscard]] long cols() const { return Rank == 0 ? 1 : static_cast<long>(nelem()) / Sizes[0]; }

    [[nodiscard]] bool same_shape(const Tensor& other) const {
        return Rank == other.Rank && std::equal(Sizes.begin(), Sizes.begin() + Rank, other.Sizes.begin());
    }

    [[nodiscard]] std::string shape_str() const;

    //! Typed pointer to the data; throws std::logic_error if @p TargetType does not match DType.
    template<class TargetType>
    [[nodiscard]] const TargetType* get() const {
        check_dtype(dtype_from_type<TargetType>);
        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] TargetType* get() {
        check_dtype(dtype_from_type<TargetType>);
        return reinterpret_cast<TargetType*>(Data);
    }

    void check_dtype(ETensorDType expected) const;

    template<typename Container>
    static Tensor from_pointer(std::byte* ptr, int device, ETensorDType dtype, const Container& shape)
    {
        if(shape.size() > MAX_TENSOR_DIM) {
            throw std::runtime_error("Tensor rank too large");
        }

        int rank = narrow<int>(shape.size());
        std::array<long, MAX_TENSOR_DIM> sizes{};
        std::copy(shape.begin(), shape.end(), sizes.begin());
        std::fill(sizes.begin() + shape.size(), sizes.end(), 1);

        return Tensor{dtype, sizes, ptr, rank, device};
    }

    //! Shape-only tensor without storage.
    static Tensor empty(ETensorDType dtype, const std::vector<long>& shape) {
        return from_pointer(nullptr, -1, dtype, shape);
    }
};

void fill_zero(Tensor& dst, cudaStream_t stream);

//! Reinterpret @p src as a rank-2 (rows, cols) view, flattening trailing dimensions.
Tensor as_matrix(const Tensor& src);

#endif //SPECTRON_SRC_UTILITIES_TENSOR_H
