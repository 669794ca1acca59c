// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_DTYPE_H
#define SPECTRON_SRC_UTILITIES_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <cuda_bf16.h>
#include <cuda_fp16.h>

enum class ETensorDType : int {
    FP32,
    BF16,
    FP16,
    INT32,
    INT8,
    BYTE
};

constexpr std::size_t get_dtype_size(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32:
        case ETensorDType::INT32:
            return 4;
        case ETensorDType::BF16:
        case ETensorDType::FP16:
            return 2;
        case ETensorDType::INT8:
        case ETensorDType::BYTE:
            return 1;
    }
    return 0;
}

//! Name of the dtype as used in safetensors headers ("F32", "BF16", ...).
const char* dtype_to_str(ETensorDType dtype);

//! Inverse of dtype_to_str; also accepts lower-case names. Throws std::runtime_error if unknown.
ETensorDType dtype_from_str(std::string_view dtype);

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<nv_bfloat16> = ETensorDType::BF16;
template<> inline constexpr ETensorDType dtype_from_type<half> = ETensorDType::FP16;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int8_t> = ETensorDType::INT8;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

#endif //SPECTRON_SRC_UTILITIES_DTYPE_H
