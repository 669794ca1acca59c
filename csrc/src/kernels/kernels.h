// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_KERNELS_KERNELS_H
#define SPECTRON_SRC_KERNELS_KERNELS_H

#include <cstddef>
#include <cstdint>

#include <cuda_bf16.h>
#include <cuda_runtime.h>

typedef struct cublasLtContext* cublasLtHandle_t;
typedef struct cublasContext* cublasHandle_t;

struct Tensor;
enum class ETensorDType: int;

enum class EMMTranspose { TT, TN, NT, NN };

// ----------------------------------------------------------------------------
// handles

cublasLtHandle_t create_cublaslt_handle();
void destroy_cublaslt_handle(cublasLtHandle_t handle) noexcept;
cublasHandle_t create_cublas_handle();
void destroy_cublas_handle(cublasHandle_t handle) noexcept;

// ----------------------------------------------------------------------------
// matrix products
// All matmul variants use column-major (cuBLAS) conventions: c is m x n, op(a) is m x k, op(b) is k x n.

void matmul(float* c, const float* a, const float* b, std::byte* workspace, std::size_t workspace_size,
            int m, int n, int k, EMMTranspose mode, bool accumulate, cublasLtHandle_t handle, cudaStream_t stream);
void matmul(Tensor& c, const Tensor& a, const Tensor& b, Tensor& workspace,
            int m, int n, int k, EMMTranspose mode, bool accumulate, cublasLtHandle_t handle, cudaStream_t stream);

/// @brief c = alpha * op(a) op(b) + beta * c in BF16 storage with FP32 accumulation, with explicit leading dimensions.
void gemm_bf16(nv_bfloat16* c, const nv_bfloat16* a, const nv_bfloat16* b,
               int m, int n, int k, int lda, int ldb, int ldc,
               EMMTranspose mode, float alpha, float beta, cublasHandle_t handle, cudaStream_t stream);

/// @brief y = op(a) x for a column-major rows x cols matrix `a` (FP32).
void gemv(float* y, const float* a, const float* x, int rows, int cols, bool transpose, cublasHandle_t handle, cudaStream_t stream);

// ----------------------------------------------------------------------------
// Newton-Schulz helpers

void convert_to_bf16(nv_bfloat16* out, const float* in, long n, cudaStream_t stream);
void convert_from_bf16(float* out, const nv_bfloat16* in, float scale, long n, cudaStream_t stream);
void transpose(nv_bfloat16* out, const nv_bfloat16* in, int rows, int cols, cudaStream_t stream);

/// @brief out = sum(x^2). `out` is cleared on `stream` before accumulation.
void sum_squares(float* out, const nv_bfloat16* x, long n, cudaStream_t stream);
/// @brief x *= 1 / (sqrt(*sum_sq) + eps)
void scale_by_inverse_norm(nv_bfloat16* x, const float* sum_sq, float eps, long n, cudaStream_t stream);

// ----------------------------------------------------------------------------
// power iteration and spectral cap

/// @brief Fill `u` with standard normal samples; the result depends only on `seed`.
void fill_normal(float* u, long n, float std, std::uint64_t seed, cudaStream_t stream);
/// @brief v /= (||v|| + eps); writes ||v|| to `norm_out` if it is not null.
void normalize_vector(float* v, float* norm_out, int n, float eps, cudaStream_t stream);
void vector_norm(float* out, const float* v, int n, cudaStream_t stream);

/// @brief param += alpha * update
void apply_update(float* param, const nv_bfloat16* update, float alpha, long n, cudaStream_t stream);

/// @brief param /= (max(1, sigma / limit) + 1e-12). A non-finite sigma leaves param
/// unchanged and increments `*degenerate_count`.
void spectral_cap(float* param, const float* sigma, float limit, int* degenerate_count, long n, cudaStream_t stream);

// ----------------------------------------------------------------------------
// momentum

/// @brief buf += (1-momentum) * (grad - buf); with nesterov, grad += momentum * (buf - grad).
void momentum_update(float* buf, float* grad, float momentum, bool nesterov, long n, cudaStream_t stream);

// ----------------------------------------------------------------------------
// model

void encoder_forward(float* out, const int* inp, const float* wte, int T, int C, cudaStream_t stream);
void encoder_forward(Tensor& out, const Tensor& inp, const Tensor& wte, int T, int C, cudaStream_t stream);
/// @brief dwte[inp[t]] += dout[t]; dwte has to be cleared by the caller.
void encoder_backward(float* dwte, const float* dout, const int* inp, int T, int C, cudaStream_t stream);
void encoder_backward(Tensor& dwte, const Tensor& dout, const Tensor& inp, int T, int C, cudaStream_t stream);

/// @brief out = gelu(inp) * scale (exact erf form)
void gelu_forward(float* out, const float* inp, float scale, long n, cudaStream_t stream);
void gelu_backward(float* dinp, const float* inp, const float* dout, float scale, long n, cudaStream_t stream);

/// @brief out = (1 - alpha) * x + alpha * branch
void residual_mix_forward(float* out, const float* x, const float* branch, float alpha, long n, cudaStream_t stream);
/// @brief dx = (1 - alpha) * dout; dbranch = alpha * dout
void residual_mix_backward(float* dx, float* dbranch, const float* dout, float alpha, long n, cudaStream_t stream);

/// @brief Softmax cross-entropy over V logits per row. Writes per-row losses, replaces the logits by
/// their gradient (scaled by dloss) if `write_dlogits`, and counts argmax hits into `correct` if not null.
void fused_classifier(float* logits, float* losses, float dloss, const int* targets, int* correct,
                      int T, int V, bool write_dlogits, cudaStream_t stream);

/// @brief out = mean(in[0:n])
void reduce_mean(float* out, const float* in, int n, cudaStream_t stream);

/// @brief *out = max over rows of the L2 norm of each row. `out` is cleared on `stream` first.
void row_norm_max(float* out, const float* w, int rows, int cols, cudaStream_t stream);
/// @brief Rescale every row whose L2 norm exceeds `max_norm` to `max_norm`.
void project_rows_max_norm(float* w, int rows, int cols, float max_norm, cudaStream_t stream);
/// @brief w_row /= (max(||w_row|| * sqrt(cols), w_max) / w_max + 1e-12)
void project_rows_rms_inf(float* w, int rows, int cols, float w_max, cudaStream_t stream);

#endif //SPECTRON_SRC_KERNELS_KERNELS_H
