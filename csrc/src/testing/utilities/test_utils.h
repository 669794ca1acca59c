// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <cstddef>
#include <cmath>
#include <iterator>
#include <random>
#include <stdexcept>
#include <vector>

#include <cuda_bf16.h>
#include <cuda_runtime.h>

#include "utilities/allocator.h"
#include "utilities/tensor.h"
#include "utilities/utils.h"

namespace testing_utils {

// BF16 helper: round-to-nearest-even conversion (emulated on CPU)
inline uint16_t float_to_bf16_bits(float f) {
    uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    // round to nearest even on the cut at 16 LSBs
    uint32_t lsb = (u >> 16) & 1u;                // last bit that will remain
    uint32_t rounding_bias = 0x7FFFu + lsb;       // RN-even
    u += rounding_bias;
    return static_cast<uint16_t>(u >> 16);
}

inline float bf16_bits_to_float(uint16_t h) {
    uint32_t u = static_cast<uint32_t>(h) << 16;
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

inline std::vector<float> round_bf16(const std::vector<float>& vec) {
    std::vector<float> result(vec.size());
    for(size_t i = 0; i < vec.size(); ++i) {
        result[i] = bf16_bits_to_float(float_to_bf16_bits(vec[i]));
    }
    return result;
}

// -----------------------------------------------------------------------------
// device transfer

//! Allocates a device tensor of @p shape and uploads @p data (synchronously).
template<typename T>
inline Tensor to_device(TensorAllocator& alloc, const char* name, const std::vector<T>& data, const std::vector<long>& shape) {
    Tensor t = alloc.allocate(dtype_from_type<T>, name, shape);
    if (t.nelem() != data.size()) {
        throw std::logic_error("to_device: data does not match shape");
    }
    CUDA_CHECK(cudaMemcpy(t.Data, data.data(), t.bytes(), cudaMemcpyHostToDevice));
    return t;
}

template<typename T>
inline std::vector<T> from_device(const Tensor& t) {
    std::vector<T> h_vec(t.nelem());
    CUDA_CHECK(cudaMemcpy(h_vec.data(), t.get<T>(), t.bytes(), cudaMemcpyDeviceToHost));
    return h_vec;
}

inline std::vector<float> bf16_from_device(const Tensor& t) {
    std::vector<std::uint16_t> bits(t.nelem());
    CUDA_CHECK(cudaMemcpy(bits.data(), t.get<nv_bfloat16>(), t.bytes(), cudaMemcpyDeviceToHost));
    std::vector<float> result(bits.size());
    std::transform(bits.begin(), bits.end(), result.begin(), bf16_bits_to_float);
    return result;
}

// -----------------------------------------------------------------------------
// random data

inline std::vector<float> uniform_host(long n, float low, float high, uint64_t seed = 12345ULL) {
    std::mt19937_64 gen(seed);
    std::uniform_real_distribution<float> dist(low, high);
    std::vector<float> data;
    data.reserve(n);
    std::generate_n(std::back_inserter(data), n, [&]() { return dist(gen); });
    return data;
}

inline void fill_normal(std::vector<float>& v, float mean = 0.0f, float stddev = 1.0f, uint64_t seed = 12345ULL) {
    std::mt19937_64 gen(seed);
    std::normal_distribution<float> dist(mean, stddev);
    for (auto& x : v) x = dist(gen);
}

// -----------------------------------------------------------------------------
// host references

//! Row-major (rows, cols) -> (cols, rows)
inline std::vector<float> transpose_host(const std::vector<float>& m, int rows, int cols) {
    std::vector<float> result(m.size());
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            result[(std::size_t)c * rows + r] = m[(std::size_t)r * cols + c];
        }
    }
    return result;
}

//! Largest singular value of a row-major matrix, by power iteration in double precision.
inline double spectral_norm_host(const std::vector<float>& m, int rows, int cols, int iterations = 500) {
    std::vector<double> u(rows, 1.0);
    std::vector<double> v(cols);
    double sigma = 0.0;
    for (int it = 0; it < iterations; ++it) {
        std::fill(v.begin(), v.end(), 0.0);
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                v[c] += m[(std::size_t)r * cols + c] * u[r];
            }
        }
        double norm_u = 0.0;
        for (int r = 0; r < rows; ++r) {
            double acc = 0.0;
            for (int c = 0; c < cols; ++c) {
                acc += m[(std::size_t)r * cols + c] * v[c];
            }
            u[r] = acc;
            norm_u += acc * acc;
        }
        norm_u = std::sqrt(norm_u);
        if (norm_u == 0.0) return 0.0;
        for (auto& x : u) x /= norm_u;
        double norm_v = 0.0;
        for (double x : v) norm_v += x * x;
        sigma = std::sqrt(norm_v);
    }
    return sigma;
}

//! ||a - b||_F / ||b||_F
inline double relative_difference(const std::vector<float>& a, const std::vector<float>& b) {
    double diff = 0.0;
    double ref = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff += ((double)a[i] - b[i]) * ((double)a[i] - b[i]);
        ref += (double)b[i] * b[i];
    }
    return std::sqrt(diff / std::max(ref, 1e-30));
}

} // namespace testing_utils
