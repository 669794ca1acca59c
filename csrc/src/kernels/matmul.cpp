// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//
// Based on llm.c https://github.com/karpathy/llm.c

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <type_traits>

#include <cublasLt.h>
#include <cublas_v2.h>
#include <fmt/core.h>

#include "kernels.h"
#include "utilities/tensor.h"
#include "utilities/utils.h"

// ----------------------------------------------------------------------------
// Setup

cublasLtHandle_t create_cublaslt_handle() {
    cublasLtHandle_t handle;
    CUBLAS_CHECK(cublasLtCreate(&handle));
    return handle;
}

void destroy_cublaslt_handle(cublasLtHandle_t handle) noexcept {
    if (handle) {
        (void)cublasLtDestroy(handle);
    }
}

cublasHandle_t create_cublas_handle() {
    cublasHandle_t handle;
    CUBLAS_CHECK(cublasCreate(&handle));
    CUBLAS_CHECK(cublasSetMathMode(handle, CUBLAS_TENSOR_OP_MATH));
    return handle;
}

void destroy_cublas_handle(cublasHandle_t handle) noexcept {
    if (handle) {
        (void)cublasDestroy(handle);
    }
}

// ----------------------------------------------------------------------------
// kernel launchers

namespace {

struct sTransposeFlags {
    bool A;
    bool B;
};

constexpr sTransposeFlags transpose_flags(EMMTranspose mode) {
    return {mode == EMMTranspose::TN || mode == EMMTranspose::TT, mode == EMMTranspose::NT || mode == EMMTranspose::TT};
}

constexpr cublasOperation_t to_op(bool transpose) {
    return transpose ? CUBLAS_OP_T : CUBLAS_OP_N;
}

// cuBLASLt descriptors, released when leaving the scope
template<class Handle, auto Destroy>
struct LtDeleter {
    void operator()(Handle h) const noexcept { (void)Destroy(h); }
};
using MatmulDesc = std::unique_ptr<std::remove_pointer_t<cublasLtMatmulDesc_t>, LtDeleter<cublasLtMatmulDesc_t, cublasLtMatmulDescDestroy>>;
using MatrixLayout = std::unique_ptr<std::remove_pointer_t<cublasLtMatrixLayout_t>, LtDeleter<cublasLtMatrixLayout_t, cublasLtMatrixLayoutDestroy>>;
using Preference = std::unique_ptr<std::remove_pointer_t<cublasLtMatmulPreference_t>, LtDeleter<cublasLtMatmulPreference_t, cublasLtMatmulPreferenceDestroy>>;

//! Column-major FP32 layout of a @p rows x @p cols matrix, as stored (before any transpose).
MatrixLayout make_layout(int rows, int cols) {
    cublasLtMatrixLayout_t layout;
    CUBLAS_CHECK(cublasLtMatrixLayoutCreate(&layout, CUDA_R_32F, rows, cols, rows));
    return MatrixLayout(layout);
}

//! Plain cuBLAS path for shapes for which no cuBLASLt heuristic returned a working algorithm.
cublasStatus_t sgemm_fallback(float* d, const float* a, const float* b, int m, int n, int k,
                              sTransposeFlags trans, float beta, cudaStream_t stream) {
    thread_local cublasHandle_t handle = create_cublas_handle();
    CUBLAS_CHECK(cublasSetStream(handle, stream));
    const float alpha = 1.f;
    return cublasSgemm(handle, to_op(trans.A), to_op(trans.B), m, n, k,
                       &alpha, a, trans.A ? k : m, b, trans.B ? n : k, &beta, d, m);
}

} // namespace

/**
 * @brief FP32 matrix product through cuBLASLt: d = op(a) * op(b) (+ d if @p accumulate).
 *
 * Tries the heuristically best algorithms that fit into @p workspace_size in order and falls
 * back to cublasSgemm if none of them runs.
 *
 * @throws std::runtime_error If a pointer is not 16-byte aligned, or no GEMM path succeeds.
 */
void matmul(float* d, const float* a, const float* b, std::byte* workspace, std::size_t workspace_size,
            int m, int n, int k, EMMTranspose mode, bool accumulate, cublasLtHandle_t handle, cudaStream_t stream) {
    const auto misaligned = [](const void* p) { return reinterpret_cast<std::uintptr_t>(p) % 16 != 0; };
    if (misaligned(a) || misaligned(b) || misaligned(d)) {
        throw std::runtime_error("matmul: cuBLASLt operands must be 16-byte aligned");
    }
    const sTransposeFlags trans = transpose_flags(mode);

    cublasLtMatmulDesc_t raw_desc;
    CUBLAS_CHECK(cublasLtMatmulDescCreate(&raw_desc, CUBLAS_COMPUTE_32F, CUDA_R_32F));
    MatmulDesc desc(raw_desc);
    const cublasOperation_t op_a = to_op(trans.A);
    const cublasOperation_t op_b = to_op(trans.B);
    CUBLAS_CHECK(cublasLtMatmulDescSetAttribute(raw_desc, CUBLASLT_MATMUL_DESC_TRANSA, &op_a, sizeof(op_a)));
    CUBLAS_CHECK(cublasLtMatmulDescSetAttribute(raw_desc, CUBLASLT_MATMUL_DESC_TRANSB, &op_b, sizeof(op_b)));

    const MatrixLayout layout_a = trans.A ? make_layout(k, m) : make_layout(m, k);
    const MatrixLayout layout_b = trans.B ? make_layout(n, k) : make_layout(k, n);
    const MatrixLayout layout_d = make_layout(m, n);

    cublasLtMatmulPreference_t raw_pref;
    CUBLAS_CHECK(cublasLtMatmulPreferenceCreate(&raw_pref));
    Preference preference(raw_pref);
    CUBLAS_CHECK(cublasLtMatmulPreferenceSetAttribute(raw_pref, CUBLASLT_MATMUL_PREF_MAX_WORKSPACE_BYTES,
                                                     &workspace_size, sizeof(workspace_size)));

    constexpr int kMaxAlgos = 8;
    cublasLtMatmulHeuristicResult_t candidates[kMaxAlgos];
    int found = 0;
    const cublasStatus_t heuristic_status = cublasLtMatmulAlgoGetHeuristic(
        handle, raw_desc, layout_a.get(), layout_b.get(), layout_d.get(), layout_d.get(), raw_pref, kMaxAlgos, candidates, &found);
    if (heuristic_status != CUBLAS_STATUS_SUCCESS) {
        found = 0;
    }

    const float alpha = 1.f;
    const float beta = accumulate ? 1.f : 0.f;
    cublasStatus_t status = CUBLAS_STATUS_NOT_SUPPORTED;
    for (int i = 0; i < found && status != CUBLAS_STATUS_SUCCESS; ++i) {
        if (candidates[i].state == CUBLAS_STATUS_SUCCESS) {
            status = cublasLtMatmul(handle, raw_desc, &alpha, a, layout_a.get(), b, layout_b.get(), &beta,
                                    d, layout_d.get(), d, layout_d.get(), &candidates[i].algo, workspace, workspace_size, stream);
        }
    }

    if (status != CUBLAS_STATUS_SUCCESS) {
        const cublasStatus_t fallback = sgemm_fallback(d, a, b, m, n, k, trans, beta, stream);
        if (fallback != CUBLAS_STATUS_SUCCESS) {
            throw std::runtime_error(fmt::format("matmul failed for m={} n={} k={} (cuBLASLt: {} over {} algorithms, cuBLAS: {})",
                                                 m, n, k, cublasGetStatusName(status), found, cublasGetStatusName(fallback)));
        }
    }
    CUDA_CHECK(cudaGetLastError());
}

void matmul(Tensor& c, const Tensor& a, const Tensor& b, Tensor& workspace,
            int m, int n, int k, EMMTranspose mode, bool accumulate, cublasLtHandle_t handle, cudaStream_t stream) {
    matmul(c.get<float>(), a.get<float>(), b.get<float>(), workspace.Data, workspace.bytes(),
           m, n, k, mode, accumulate, handle, stream);
}

/**
 * @brief BF16 GEMM with arbitrary alpha/beta for the Newton-Schulz iteration.
 *
 * Storage is BF16, accumulation FP32 on tensor cores.
 */
void gemm_bf16(nv_bfloat16* c, const nv_bfloat16* a, const nv_bfloat16* b,
               int m, int n, int k, int lda, int ldb, int ldc,
               EMMTranspose mode, float alpha, float beta, cublasHandle_t handle, cudaStream_t stream) {
    const sTransposeFlags trans = transpose_flags(mode);
    CUBLAS_CHECK(cublasSetStream(handle, stream));
    CUBLAS_CHECK(cublasGemmEx(handle, to_op(trans.A), to_op(trans.B), m, n, k,
                              &alpha,
                              a, to_cuda_lib_type_enum<nv_bfloat16>, lda,
                              b, to_cuda_lib_type_enum<nv_bfloat16>, ldb,
                              &beta,
                              c, to_cuda_lib_type_enum<nv_bfloat16>, ldc,
                              CUBLAS_COMPUTE_32F, CUBLAS_GEMM_DEFAULT_TENSOR_OP));
}

void gemv(float* y, const float* a, const float* x, int rows, int cols, bool transpose, cublasHandle_t handle, cudaStream_t stream) {
    const float one = 1.f;
    const float zero = 0.f;
    CUBLAS_CHECK(cublasSetStream(handle, stream));
    CUBLAS_CHECK(cublasSgemv(handle, to_op(transpose), rows, cols, &one, a, rows, x, 1, &zero, y, 1));
}
