// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_UTILS_H
#define SPECTRON_SRC_UTILITIES_UTILS_H

#include <concepts>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <cuda_bf16.h>
#include <cublas_v2.h>
#include <driver_types.h>
#include <library_types.h>

#ifndef __CUDACC__
#define HOST_DEVICE
#else
#define HOST_DEVICE __host__ __device__
#endif

/// Thrown by CUDA_CHECK; keeps the original status so callers can react to e.g. OOM
class cuda_error : public std::runtime_error {
public:
    cuda_error(cudaError_t err, const std::string& arg) :
            std::runtime_error(arg), code(err){};

    cudaError_t code;
};

/// Check `status`; if it isn't `cudaSuccess`, throw the corresponding `cuda_error`
void cuda_throw_on_error(cudaError_t status, const char* statement, const char* file, int line);

#define CUDA_CHECK(status) cuda_throw_on_error(status, #status, __FILE__, __LINE__)

/// Check cuBLAS status; throws std::runtime_error on error
void cublas_throw_on_error(cublasStatus_t status, const char* statement, const char* file, int line);

#define CUBLAS_CHECK(status) cublas_throw_on_error(status, #status, __FILE__, __LINE__)

template<std::integral T>
constexpr T HOST_DEVICE div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

[[noreturn]] void throw_not_divisible(long long dividend, long long divisor);

template<std::integral T>
constexpr T div_exact(T dividend, T divisor) {
    if(dividend % divisor != 0) {
        throw_not_divisible(dividend, divisor);
    }
    return dividend / divisor;
}

//! Checked integer conversion; throws std::out_of_range if @p input does not fit into Dst.
template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if (!std::in_range<Dst>(input)) {
        throw std::out_of_range(std::to_string(input) + " does not fit the target integer type");
    }
    return static_cast<Dst>(input);
}

// ----------------------------------------------------------------------------
template<typename Scalar>
inline cudaDataType to_cuda_lib_type_enum;

template<> inline constexpr cudaDataType to_cuda_lib_type_enum<float> = cudaDataType::CUDA_R_32F;
template<> inline constexpr cudaDataType to_cuda_lib_type_enum<nv_bfloat16> = cudaDataType::CUDA_R_16BF;
template<> inline constexpr cudaDataType to_cuda_lib_type_enum<std::int8_t> = cudaDataType::CUDA_R_8I;

// ----------------------------------------------------------------------------
// NVTX utils

class NvtxRange {
public:
    explicit NvtxRange(const char* s) noexcept;
    ~NvtxRange() noexcept;
};
#define NVTX_RANGE_FN() NvtxRange nvtx_range_##__COUNTER__ (__FUNCTION__)

cudaStream_t create_named_stream(const char* name);
cudaEvent_t create_named_event(const char* name, bool timing=false);

/// Returns true if at least one CUDA device is visible; never throws.
bool cuda_device_available() noexcept;

// ----------------------------------------------------------------------------
bool iequals(std::string_view lhs, std::string_view rhs);

/// Mixes a sequence of integers into a 64-bit seed (splitmix64 finalizer per element).
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t a, std::uint64_t b);

#endif //SPECTRON_SRC_UTILITIES_UTILS_H
