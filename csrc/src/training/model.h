// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_TRAINING_MODEL_H
#define SPECTRON_SRC_TRAINING_MODEL_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cuda_runtime.h>

#include "logging.h"
#include "runtime/optimizers/muon.h"
#include "runtime/optimizers/optimizer_config.h"
#include "utilities/tensor.h"
#include "utilities/tensor_container.h"

class NCCLCommunicator;
class TensorAllocator;
class DataLoader;

namespace optimizers { class SpectralNormEstimator; }

typedef struct cublasLtContext* cublasLtHandle_t;

struct ModelConfig {
    int VocabSize = 50257;
    int ModelDim = 768;
    int NumLayers = 12;

    //! Vocabulary rounded up to a multiple of 128; the LM head has this many rows.
    [[nodiscard]] int padded_vocab_size() const { return ((VocabSize + 127) / 128) * 128; }
    [[nodiscard]] int hidden_dim() const { return 4 * ModelDim; }
};

//! Weights of one residual MLP block.
struct BlockWeights {
    Tensor In;      //!< (4C, C)
    Tensor Out;     //!< (C, 4C)
};

class ModelWeights : public ITensorContainer {
public:
    Tensor Embedding;               //!< (V, C)
    std::vector<BlockWeights> Blocks;
    Tensor LMHead;                  //!< (Vp, C)

    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;
};

/**
 * @brief First and second AdamW moments, saved as `<name>.m` / `<name>.v`.
 */
class AdamState : public ITensorContainer {
public:
    struct Entry {
        std::string Name;
        Tensor Param;
        Tensor Grad;
        Tensor M;
        Tensor V;
        float LearningRate;
    };

    std::vector<Entry> Entries;

    void iterate_tensors(const std::function<void(std::string, const Tensor&)>& callback) override;
};

/**
 * @brief Residual MLP language model used to drive the optimizer end to end.
 *
 *   x = Embed(tokens)
 *   x = (1 - a) x + a W_out (gelu(W_in x) / 1.1289)     for every block, a = 1 / (2L)
 *   logits = W_head x
 *
 * Parameters are FP32 and replicated on every rank; each rank processes its own sequence
 * of length T, and gradients are averaged across ranks before the optimizer step.
 */
class ResidualMLPModel {
public:
    ResidualMLPModel(const ModelConfig& config, int seq_len, const optimizers::OptimizerConfig& opt_config,
                     NCCLCommunicator& comm, std::shared_ptr<TensorAllocator> allocator);
    ~ResidualMLPModel();

    ResidualMLPModel(const ResidualMLPModel&) = delete;
    ResidualMLPModel& operator=(const ResidualMLPModel&) = delete;

    //! Deterministic initialization; identical on every rank for the same seed.
    void init_weights(std::uint64_t seed);

    //! Pinned host buffers the data loader fills; uploaded by forward().
    Tensor& input_buffer() { return mInputsCPU; }
    Tensor& target_buffer() { return mTargetsCPU; }

    //! Forward, loss, backward, and the cross-rank gradient average.
    void forward_backward(NCCLCommunicator& comm);

    /**
     * @brief Optimizer step: Muon for hidden matrices (and the head if configured), AdamW for the
     * rest, followed by the row projections of embedding and head.
     */
    void update(const optimizers::StepParameters& params);

    //! Mean loss and accuracy over @p num_batches batches of @p loader, averaged over all ranks.
    std::pair<float, float> evaluate(DataLoader& loader, int num_batches, NCCLCommunicator& comm);

    //! Mean training loss of the most recent forward_backward(). Synchronizes.
    [[nodiscard]] float get_loss() const;

    //! Operator norms of all weights, for the eval report.
    std::vector<WeightNormRecord> weight_norms();

    ModelWeights& weights() { return mWeights; }
    AdamState& adam_state() { return mAdam; }
    optimizers::Muon& muon() { return *mMuon; }
    [[nodiscard]] const ModelConfig& config() const { return mConfig; }
    [[nodiscard]] int seq_len() const { return mSeqLen; }
    [[nodiscard]] cudaStream_t stream() const { return mStream; }

    //! Number of AdamW steps taken so far (bias correction); restored from checkpoints.
    [[nodiscard]] int adam_steps() const { return mAdamSteps; }
    void set_adam_steps(int steps) { mAdamSteps = steps; }

private:
    void forward(bool training);
    void backward();
    void project_weights();

    ModelConfig mConfig;
    optimizers::OptimizerConfig mOptConfig;
    int mSeqLen;
    float mResidualAlpha;

    std::shared_ptr<TensorAllocator> mAllocator;
    NCCLCommunicator* mComm;
    cudaStream_t mStream = nullptr;
    cudaEvent_t mGradsReduced = nullptr;
    cudaEvent_t mTransferDone = nullptr;
    cublasLtHandle_t mCublasLt = nullptr;
    Tensor mWorkspace;

    ModelWeights mWeights;
    ModelWeights mGrads;
    AdamState mAdam;
    int mAdamSteps = 0;
    std::unordered_map<std::string, Tensor*> mGradByName;

    std::unique_ptr<optimizers::Muon> mMuon;
    std::unique_ptr<optimizers::SpectralNormEstimator> mNormEstimator;

    // activations
    Tensor mInputs;         //!< (T) INT32
    Tensor mTargets;        //!< (T) INT32
    Tensor mInputsCPU;
    Tensor mTargetsCPU;
    std::vector<Tensor> mResidual;  //!< L+1 x (T, C)
    std::vector<Tensor> mPreAct;    //!< L x (T, 4C)
    std::vector<Tensor> mAct;       //!< L x (T, 4C)
    std::vector<Tensor> mBranch;    //!< L x (T, C)
    Tensor mLogits;         //!< (T, Vp); holds dlogits after backward
    Tensor mLosses;         //!< (T)
    Tensor mLoss;           //!< scalar
    Tensor mCorrect;        //!< INT32 scalar
    Tensor mScalar;         //!< scratch scalar for norms

    // backward scratch
    Tensor mDResidual;
    Tensor mDResidualNext;
    Tensor mDBranch;
    Tensor mDAct;
    Tensor mDPreAct;

    Tensor mInitScratch;    //!< BF16, orthogonalized init
};

#endif //SPECTRON_SRC_TRAINING_MODEL_H
