// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "utils.h"

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return "F32";
        case ETensorDType::BF16: return "BF16";
        case ETensorDType::FP16: return "F16";
        case ETensorDType::INT32: return "I32";
        case ETensorDType::INT8: return "I8";
        case ETensorDType::BYTE: return "U8";
    }
    return "<invalid>";
}

/**
 * @brief Parse a dtype name as it appears in safetensors headers or on the command line.
 *
 * Accepts the safetensors spellings (F32, BF16, ...) as well as the common aliases
 * fp32/bf16/fp16/int32/int8/byte, case-insensitively.
 *
 * @throws std::runtime_error If @p dtype does not name a supported type.
 */
ETensorDType dtype_from_str(std::string_view dtype) {
    if (iequals(dtype, "F32") || iequals(dtype, "fp32") || iequals(dtype, "float32")) {
        return ETensorDType::FP32;
    } else if (iequals(dtype, "BF16") || iequals(dtype, "bfloat16")) {
        return ETensorDType::BF16;
    } else if (iequals(dtype, "F16") || iequals(dtype, "fp16") || iequals(dtype, "float16")) {
        return ETensorDType::FP16;
    } else if (iequals(dtype, "I32") || iequals(dtype, "int32")) {
        return ETensorDType::INT32;
    } else if (iequals(dtype, "I8") || iequals(dtype, "int8")) {
        return ETensorDType::INT8;
    } else if (iequals(dtype, "U8") || iequals(dtype, "byte")) {
        return ETensorDType::BYTE;
    }
    throw std::runtime_error(fmt::format("Unsupported dtype '{}'", dtype));
}
