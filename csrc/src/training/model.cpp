// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "model.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "kernels/kernels.h"
#include "runtime/optimizers/adamw.h"
#include "runtime/optimizers/newton_schulz.h"
#include "runtime/optimizers/spectral_norm.h"
#include "runtime/training/dataloader.h"
#include "utilities/allocator.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

namespace {

constexpr float kGeluScale = 1.f / 1.1289f;
constexpr std::size_t kCublasWorkspaceBytes = 32 * 1024 * 1024;

constexpr int kHiddenHyperSet = 0;
constexpr int kHeadHyperSet = 1;

std::string block_name(int layer, const char* weight) {
    return fmt::format("blocks.{}.{}", layer, weight);
}

} // namespace

void ModelWeights::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    callback("embed.weight", Embedding);
    for (int l = 0; l < (int)Blocks.size(); ++l) {
        callback(block_name(l, "w_in"), Blocks[l].In);
        callback(block_name(l, "w_out"), Blocks[l].Out);
    }
    callback("lm_head.weight", LMHead);
}

void AdamState::iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) {
    for (const auto& entry : Entries) {
        callback(entry.Name + ".m", entry.M);
        callback(entry.Name + ".v", entry.V);
    }
}

ResidualMLPModel::ResidualMLPModel(const ModelConfig& config, int seq_len, const optimizers::OptimizerConfig& opt_config,
                                   NCCLCommunicator& comm, std::shared_ptr<TensorAllocator> allocator) :
    mConfig(config), mOptConfig(opt_config), mSeqLen(seq_len),
    mResidualAlpha(1.f / (2.f * config.NumLayers)), mAllocator(std::move(allocator)), mComm(&comm)
{
    if (config.NumLayers <= 0 || config.ModelDim <= 0 || config.VocabSize <= 0 || seq_len <= 0) {
        throw std::invalid_argument(fmt::format("Invalid model configuration: V={}, C={}, L={}, T={}",
                                                config.VocabSize, config.ModelDim, config.NumLayers, seq_len));
    }

    const long V = config.VocabSize;
    const long Vp = config.padded_vocab_size();
    const long C = config.ModelDim;
    const long H = config.hidden_dim();
    const long T = seq_len;
    const int L = config.NumLayers;
    TensorAllocator& alloc = *mAllocator;

    mStream = create_named_stream("main");
    mGradsReduced = create_named_event("grads_reduced");
    mTransferDone = create_named_event("transfer_done");
    mCublasLt = create_cublaslt_handle();
    mWorkspace = alloc.allocate(ETensorDType::BYTE, "cublas_workspace", {(long)kCublasWorkspaceBytes});

    auto allocate_weights = [&](ModelWeights& target, const char* kind) {
        auto ctx = alloc.with_context(kind);
        target.Embedding = alloc.allocate(ETensorDType::FP32, "embed", {V, C});
        target.Blocks.resize(L);
        for (auto& block : target.Blocks) {
            block.In = alloc.allocate(ETensorDType::FP32, "w_in", {H, C});
            block.Out = alloc.allocate(ETensorDType::FP32, "w_out", {C, H});
        }
        target.LMHead = alloc.allocate(ETensorDType::FP32, "lm_head", {Vp, C});
    };
    allocate_weights(mWeights, "Weights");
    allocate_weights(mGrads, "Gradients");

    mGradByName["embed.weight"] = &mGrads.Embedding;
    for (int l = 0; l < L; ++l) {
        mGradByName[block_name(l, "w_in")] = &mGrads.Blocks[l].In;
        mGradByName[block_name(l, "w_out")] = &mGrads.Blocks[l].Out;
    }
    mGradByName["lm_head.weight"] = &mGrads.LMHead;

    {
        auto ctx = alloc.with_context("Activations");
        mInputs = alloc.allocate(ETensorDType::INT32, "inputs", {T});
        mTargets = alloc.allocate(ETensorDType::INT32, "targets", {T});
        mInputsCPU = alloc.allocate(ETensorDType::INT32, "inputs_cpu", EAllocationType::PINNED, {T});
        mTargetsCPU = alloc.allocate(ETensorDType::INT32, "targets_cpu", EAllocationType::PINNED, {T});
        for (int l = 0; l <= L; ++l) {
            mResidual.push_back(alloc.allocate(ETensorDType::FP32, "residual", {T, C}));
        }
        for (int l = 0; l < L; ++l) {
            mPreAct.push_back(alloc.allocate(ETensorDType::FP32, "pre_act", {T, H}));
            mAct.push_back(alloc.allocate(ETensorDType::FP32, "act", {T, H}));
            mBranch.push_back(alloc.allocate(ETensorDType::FP32, "branch", {T, C}));
        }
        mLogits = alloc.allocate(ETensorDType::FP32, "logits", {T, Vp});
        mLosses = alloc.allocate(ETensorDType::FP32, "losses", {T});
        mLoss = alloc.allocate(ETensorDType::FP32, "loss", {1});
        mCorrect = alloc.allocate(ETensorDType::INT32, "correct", {1});
        mScalar = alloc.allocate(ETensorDType::FP32, "scalar", {1});
        mDResidual = alloc.allocate(ETensorDType::FP32, "d_residual", {T, C});
        mDResidualNext = alloc.allocate(ETensorDType::FP32, "d_residual_next", {T, C});
        mDBranch = alloc.allocate(ETensorDType::FP32, "d_branch", {T, C});
        mDAct = alloc.allocate(ETensorDType::FP32, "d_act", {T, H});
        mDPreAct = alloc.allocate(ETensorDType::FP32, "d_pre_act", {T, H});
        mInitScratch = alloc.allocate(ETensorDType::BF16, "init_scratch", {H * C});
    }

    // Muon: hidden matrices, and the LM head unless it is on AdamW
    std::vector<optimizers::ParameterSpec> muon_params;
    for (int l = 0; l < L; ++l) {
        muon_params.push_back({block_name(l, "w_in"), mWeights.Blocks[l].In, kHiddenHyperSet});
        muon_params.push_back({block_name(l, "w_out"), mWeights.Blocks[l].Out, kHiddenHyperSet});
    }
    if (mOptConfig.lm_head_muon) {
        muon_params.push_back({"lm_head.weight", mWeights.LMHead, kHeadHyperSet});
    }
    std::vector<optimizers::HyperParameters> hyper_sets = {
        {mOptConfig.muon_lr, mOptConfig.nesterov, mOptConfig.w_max},
        {mOptConfig.lm_head_lr, mOptConfig.nesterov, mOptConfig.lm_head_w_max},
    };
    mMuon = std::make_unique<optimizers::Muon>(std::move(muon_params), std::move(hyper_sets), comm, alloc, mStream,
                                               mOptConfig.ns_coefficients, mOptConfig.power_iterations);

    // AdamW: embeddings, and the LM head if it is not on Muon
    {
        auto ctx = alloc.with_context("AdamW");
        auto add_adam = [&](const std::string& name, Tensor& param, Tensor& grad, float lr) {
            const std::vector<long> shape(param.Sizes.begin(), param.Sizes.begin() + param.Rank);
            Tensor m = alloc.allocate(ETensorDType::FP32, "adam_m", shape);
            Tensor v = alloc.allocate(ETensorDType::FP32, "adam_v", shape);
            fill_zero(m, mStream);
            fill_zero(v, mStream);
            mAdam.Entries.push_back({name, param, grad, m, v, lr});
        };
        add_adam("embed.weight", mWeights.Embedding, mGrads.Embedding, mOptConfig.adam_lr);
        if (!mOptConfig.lm_head_muon) {
            add_adam("lm_head.weight", mWeights.LMHead, mGrads.LMHead, mOptConfig.lm_head_lr);
        }
    }

    mNormEstimator = std::make_unique<optimizers::SpectralNormEstimator>(std::max({V, Vp, H}), alloc, mOptConfig.power_iterations);
}

ResidualMLPModel::~ResidualMLPModel() {
    destroy_cublaslt_handle(mCublasLt);
    if (mGradsReduced) cudaEventDestroy(mGradsReduced);
    if (mTransferDone) cudaEventDestroy(mTransferDone);
    if (mStream) cudaStreamDestroy(mStream);
}

/**
 * @brief Embeddings ~ N(0, 1) then row-projected; W_in orthogonalized and scaled by
 * sqrt(rows / cols); W_out and the LM head start at zero.
 */
void ResidualMLPModel::init_weights(std::uint64_t seed) {
    NVTX_RANGE_FN();
    const long C = mConfig.ModelDim;
    const long H = mConfig.hidden_dim();

    fill_normal(mWeights.Embedding.get<float>(), (long)mWeights.Embedding.nelem(), 1.f, mix_seed(seed, 0, 0), mStream);
    for (int l = 0; l < mConfig.NumLayers; ++l) {
        Tensor& w_in = mWeights.Blocks[l].In;
        fill_normal(w_in.get<float>(), H * C, 1.f, mix_seed(seed, 1, l), mStream);
        mMuon->orthogonalizer().orthogonalize(w_in, mInitScratch, mStream);
        convert_from_bf16(w_in.get<float>(), mInitScratch.get<nv_bfloat16>(), std::sqrt((float)H / (float)C), H * C, mStream);
        fill_zero(mWeights.Blocks[l].Out, mStream);
    }
    fill_zero(mWeights.LMHead, mStream);
    project_weights();
    CUDA_CHECK(cudaStreamSynchronize(mStream));
}

void ResidualMLPModel::forward(bool training) {
    NVTX_RANGE_FN();
    const int T = mSeqLen;
    const int C = mConfig.ModelDim;
    const int H = mConfig.hidden_dim();
    const int Vp = mConfig.padded_vocab_size();
    const int L = mConfig.NumLayers;

    CUDA_CHECK(cudaMemcpyAsync(mInputs.Data, mInputsCPU.Data, mInputs.bytes(), cudaMemcpyHostToDevice, mStream));
    CUDA_CHECK(cudaMemcpyAsync(mTargets.Data, mTargetsCPU.Data, mTargets.bytes(), cudaMemcpyHostToDevice, mStream));
    CUDA_CHECK(cudaEventRecord(mTransferDone, mStream));
    // the host buffers are refilled as soon as we return
    CUDA_CHECK(cudaEventSynchronize(mTransferDone));

    encoder_forward(mResidual[0], mInputs, mWeights.Embedding, T, C, mStream);
    for (int l = 0; l < L; ++l) {
        const BlockWeights& w = mWeights.Blocks[l];
        matmul(mPreAct[l], w.In, mResidual[l], mWorkspace, H, T, C, EMMTranspose::TN, false, mCublasLt, mStream);
        gelu_forward(mAct[l].get<float>(), mPreAct[l].get<float>(), kGeluScale, (long)T * H, mStream);
        matmul(mBranch[l], w.Out, mAct[l], mWorkspace, C, T, H, EMMTranspose::TN, false, mCublasLt, mStream);
        residual_mix_forward(mResidual[l + 1].get<float>(), mResidual[l].get<float>(), mBranch[l].get<float>(),
                             mResidualAlpha, (long)T * C, mStream);
    }
    matmul(mLogits, mWeights.LMHead, mResidual[L], mWorkspace, Vp, T, C, EMMTranspose::TN, false, mCublasLt, mStream);

    // the gradient is that of the summed loss; the reported loss is the mean
    fused_classifier(mLogits.get<float>(), mLosses.get<float>(), 1.f, mTargets.get<std::int32_t>(),
                     training ? nullptr : mCorrect.get<std::int32_t>(), T, Vp, training, mStream);
    reduce_mean(mLoss.get<float>(), mLosses.get<float>(), T, mStream);
}

void ResidualMLPModel::backward() {
    NVTX_RANGE_FN();
    const int T = mSeqLen;
    const int C = mConfig.ModelDim;
    const int H = mConfig.hidden_dim();
    const int Vp = mConfig.padded_vocab_size();
    const int L = mConfig.NumLayers;

    Tensor* dx = &mDResidual;
    Tensor* dx_next = &mDResidualNext;

    // mLogits holds dlogits
    matmul(mGrads.LMHead, mResidual[L], mLogits, mWorkspace, C, Vp, T, EMMTranspose::NT, false, mCublasLt, mStream);
    matmul(*dx, mWeights.LMHead, mLogits, mWorkspace, C, T, Vp, EMMTranspose::NN, false, mCublasLt, mStream);

    for (int l = L - 1; l >= 0; --l) {
        const BlockWeights& w = mWeights.Blocks[l];
        BlockWeights& dw = mGrads.Blocks[l];
        residual_mix_backward(dx_next->get<float>(), mDBranch.get<float>(), dx->get<float>(), mResidualAlpha, (long)T * C, mStream);

        matmul(dw.Out, mAct[l], mDBranch, mWorkspace, H, C, T, EMMTranspose::NT, false, mCublasLt, mStream);
        matmul(mDAct, w.Out, mDBranch, mWorkspace, H, T, C, EMMTranspose::NN, false, mCublasLt, mStream);
        gelu_backward(mDPreAct.get<float>(), mPreAct[l].get<float>(), mDAct.get<float>(), kGeluScale, (long)T * H, mStream);

        matmul(dw.In, mResidual[l], mDPreAct, mWorkspace, C, H, T, EMMTranspose::NT, false, mCublasLt, mStream);
        // residual path already in dx_next; add the branch contribution
        matmul(*dx_next, w.In, mDPreAct, mWorkspace, C, T, H, EMMTranspose::NN, true, mCublasLt, mStream);
        std::swap(dx, dx_next);
    }

    fill_zero(mGrads.Embedding, mStream);
    encoder_backward(mGrads.Embedding, *dx, mInputs, T, C, mStream);
}

void ResidualMLPModel::forward_backward(NCCLCommunicator& comm) {
    forward(true);
    backward();

    comm.begin_transaction(mStream);
    comm.schedule_all_reduce_avg(mGrads.Embedding);
    for (auto& block : mGrads.Blocks) {
        comm.schedule_all_reduce_avg(block.In);
        comm.schedule_all_reduce_avg(block.Out);
    }
    comm.schedule_all_reduce_avg(mGrads.LMHead);
    comm.execute_transaction(mGradsReduced);
    CUDA_CHECK(cudaStreamWaitEvent(mStream, mGradsReduced, 0));
}

void ResidualMLPModel::update(const optimizers::StepParameters& params) {
    NVTX_RANGE_FN();
    mMuon->step(params, [this](const optimizers::ParameterSpec& spec) -> Tensor* {
        auto found = mGradByName.find(spec.Name);
        return found == mGradByName.end() ? nullptr : found->second;
    });

    ++mAdamSteps;
    const float beta1_correction = optimizers::adamw_bias_correction(mOptConfig.adam_beta1, mAdamSteps);
    const float beta2_correction = optimizers::adamw_bias_correction(mOptConfig.adam_beta2, mAdamSteps);
    for (auto& entry : mAdam.Entries) {
        optimizers::adamw_update(entry.Param.get<float>(), entry.Grad.get<float>(), entry.M.get<float>(), entry.V.get<float>(),
                                 entry.Param.nelem(), entry.LearningRate * params.LearningRateScale,
                                 mOptConfig.adam_beta1, mOptConfig.adam_beta2, beta1_correction, beta2_correction,
                                 mOptConfig.adam_epsilon, mOptConfig.adam_weight_decay, mStream);
    }

    project_weights();
}

/**
 * @brief Embedding rows to l2 norm <= emb_w_max * sqrt(C); LM head rows to RMS->INF <= lm_head_w_max
 * when the head is trained by AdamW.
 */
void ResidualMLPModel::project_weights() {
    const int C = mConfig.ModelDim;
    project_rows_max_norm(mWeights.Embedding.get<float>(), mConfig.VocabSize, C, mOptConfig.emb_w_max * std::sqrt((float)C), mStream);
    if (!mOptConfig.lm_head_muon) {
        project_rows_rms_inf(mWeights.LMHead.get<float>(), mConfig.padded_vocab_size(), C, mOptConfig.lm_head_w_max, mStream);
    }
}

float ResidualMLPModel::get_loss() const {
    float loss = 0.f;
    CUDA_CHECK(cudaMemcpyAsync(&loss, mLoss.Data, sizeof(float), cudaMemcpyDeviceToHost, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));
    return loss;
}

std::pair<float, float> ResidualMLPModel::evaluate(DataLoader& loader, int num_batches, NCCLCommunicator& comm) {
    NVTX_RANGE_FN();
    if (num_batches <= 0) {
        throw std::invalid_argument(fmt::format("evaluate: need at least one batch, got {}", num_batches));
    }

    loader.set_state(0, 0, 0);
    fill_zero(mCorrect, mStream);
    double loss_sum = 0.0;
    for (int i = 0; i < num_batches; ++i) {
        loader.load_batch(mInputsCPU, mTargetsCPU);
        forward(false);
        loss_sum += get_loss();
    }

    const float mean_loss = static_cast<float>(loss_sum / num_batches);
    CUDA_CHECK(cudaMemcpyAsync(mLoss.Data, &mean_loss, sizeof(float), cudaMemcpyHostToDevice, mStream));
    comm.reduce_loss(mLoss.get<float>(), mStream);
    comm.all_reduce_sum_int(mCorrect.get<std::int32_t>(), 1, mStream);

    float loss = 0.f;
    int correct = 0;
    CUDA_CHECK(cudaMemcpyAsync(&loss, mLoss.Data, sizeof(float), cudaMemcpyDeviceToHost, mStream));
    CUDA_CHECK(cudaMemcpyAsync(&correct, mCorrect.Data, sizeof(int), cudaMemcpyDeviceToHost, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));

    const double total = (double)num_batches * comm.world_size() * mSeqLen;
    return {loss, static_cast<float>(correct / total)};
}

std::vector<WeightNormRecord> ResidualMLPModel::weight_norms() {
    NVTX_RANGE_FN();
    std::vector<WeightNormRecord> result;
    const int C = mConfig.ModelDim;

    auto rms_to_rms = [&](const Tensor& w) {
        const float sigma = mNormEstimator->estimate_host(w, 0, mStream);
        return sigma * std::sqrt((float)w.cols() / (float)w.rows());
    };
    auto max_row_norm = [&](const Tensor& w) {
        row_norm_max(mScalar.get<float>(), w.get<float>(), (int)w.rows(), (int)w.cols(), mStream);
        float value = 0.f;
        CUDA_CHECK(cudaMemcpyAsync(&value, mScalar.Data, sizeof(float), cudaMemcpyDeviceToHost, mStream));
        CUDA_CHECK(cudaStreamSynchronize(mStream));
        return value;
    };

    const float emb_rms = rms_to_rms(mWeights.Embedding);
    result.push_back({"embed.weight", "l1->RMS", max_row_norm(mWeights.Embedding) / std::sqrt((float)C), emb_rms});
    for (int l = 0; l < mConfig.NumLayers; ++l) {
        const float in = rms_to_rms(mWeights.Blocks[l].In);
        const float out = rms_to_rms(mWeights.Blocks[l].Out);
        result.push_back({block_name(l, "w_in"), "RMS->RMS", in, in});
        result.push_back({block_name(l, "w_out"), "RMS->RMS", out, out});
    }
    const float head_rms = rms_to_rms(mWeights.LMHead);
    result.push_back({"lm_head.weight", "RMS->INF", max_row_norm(mWeights.LMHead) * std::sqrt((float)C), head_rms});
    return result;
}
