// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cctype>

#include <cuda_runtime.h>
#include <fmt/format.h>
#include <nvtx3/nvToolsExt.h>
#include <nvtx3/nvToolsExtCudaRt.h>

void cuda_throw_on_error(cudaError_t status, const char* statement, const char* file, int line) {
    if (status == cudaSuccess) {
        return;
    }
    // reset the sticky error so handlers can still talk to the runtime
    (void)cudaGetLastError();
    throw cuda_error(status, fmt::format("CUDA error {} in {}:{} ({}): {}",
                                         cudaGetErrorName(status), file, line, statement, cudaGetErrorString(status)));
}

void cublas_throw_on_error(cublasStatus_t status, const char* statement, const char* file, int line) {
    if (status != CUBLAS_STATUS_SUCCESS) {
        throw std::runtime_error(fmt::format("cuBLAS error {} in {}:{} ({}): {}",
                                             cublasGetStatusName(status), file, line, statement, cublasGetStatusString(status)));
    }
}

NvtxRange::NvtxRange(const char* s) noexcept { nvtxRangePush(s); }

NvtxRange::~NvtxRange() noexcept { nvtxRangePop(); }

//! The caller owns the returned stream; the name shows up in Nsight timelines.
cudaStream_t create_named_stream(const char* name) {
    cudaStream_t stream;
    CUDA_CHECK(cudaStreamCreate(&stream));
    nvtxNameCudaStreamA(stream, name);
    return stream;
}

cudaEvent_t create_named_event(const char* name, bool timing) {
    cudaEvent_t event;
    CUDA_CHECK(cudaEventCreateWithFlags(&event, timing ? cudaEventDefault : cudaEventDisableTiming));
    nvtxNameCudaEventA(event, name);
    return event;
}

bool cuda_device_available() noexcept {
    int count = 0;
    if (cudaGetDeviceCount(&count) != cudaSuccess) {
        (void)cudaGetLastError();
        return false;
    }
    return count > 0;
}

bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

[[noreturn]] void throw_not_divisible(long long dividend, long long divisor) {
    throw std::runtime_error(fmt::format("Cannot divide {} by {}", dividend, divisor));
}

namespace {
std::uint64_t splitmix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}
} // namespace

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t a, std::uint64_t b) {
    return splitmix64(splitmix64(splitmix64(base) ^ a) ^ b);
}
