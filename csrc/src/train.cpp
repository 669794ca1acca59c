// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>

#include <cuda_runtime.h>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "runtime/optimizers/newton_schulz.h"
#include "runtime/optimizers/optimizer_config.h"
#include "runtime/training/checkpoint.h"
#include "runtime/training/dataloader.h"
#include "runtime/training/schedule.h"
#include "training/logging.h"
#include "training/model.h"
#include "utilities/allocator.h"
#include "utilities/comm.h"
#include "utilities/safetensors.h"
#include "utilities/utils.h"

namespace {

//! Substitutes every `%n` in @p pattern with the run name.
std::string expand_run_name(std::string pattern, const std::string& run_name) {
    for (auto pos = pattern.find("%n"); pos != std::string::npos; pos = pattern.find("%n", pos + run_name.size())) {
        pattern.replace(pos, 2, run_name);
    }
    return pattern;
}

} // namespace

/**
 * @brief End-to-end training runner: CLI config parsing, distributed setup, training loop, eval/checkpoint/export.
 *
 * Parameters are stored as public fields so CLI11 can bind options directly.
 */
struct TrainingRunner {
    /// Sequence length (tokens) per rank and step.
    int T = 1024;
    /// Number of optimizer steps.
    int MaxSteps = 1770;

    /// Fraction of training spent cooling down the learning rate.
    float CooldownFrac = 0.4f;
    /// Learning-rate multiplier at the end of the cooldown.
    float LrFloor = 0.1f;
    /// Steps over which the Muon momentum ramps from MomentumStart to MomentumEnd.
    int MomentumWarmupSteps = 300;
    float MomentumStart = 0.85f;
    float MomentumEnd = 0.95f;

    ModelConfig Model;
    optimizers::OptimizerConfig Optimizer;
    std::uint64_t Seed = 42;

    std::string TrainFile = "data/fineweb10B/fineweb_train_*.bin";
    std::string EvalFile = "data/fineweb10B/fineweb_val_*.bin";
    /// Tokens per evaluation, summed over all ranks. Must be a multiple of world * T.
    long EvalTokens = 10485760;
    /// Evaluate every n steps (and always after the last step). 0 evaluates only at the end.
    int EvalEvery = 125;

    std::string OutDir = "";
    std::string CkptDir = "ckpt/%n";
    /// How many optimizer steps between checkpoints. 0 disables intermediate checkpoints.
    int CkptEvery = 0;
    int CkptToKeep = -1;
    bool ContinueFromCheckpoint = false;

    std::string LogFile = "logs/%n.json";
    std::string RunName = "spectron";
    int LogVerbosity = TrainingRunLogger::DEFAULT;

    int NGPUs = 0;
    bool MemcpyAllGather = false;

    std::chrono::steady_clock::time_point BeginStartup;

    void load_training_config(int argc, const char** argv);
    void launch_training(int argc, const char** argv);

private:
    void run_training(int argc, const char** argv, NCCLCommunicator& comm);
    void run_evaluation(ResidualMLPModel& model, DataLoader& eval_loader, TrainingRunLogger& logger,
                        int step, NCCLCommunicator& comm);
};

void TrainingRunner::load_training_config(int argc, const char** argv) {
    BeginStartup = std::chrono::steady_clock::now();

    CLI::App app("Muon training with spectral weight caps");
    app.set_config("--config", "", "Read options from a TOML/INI configuration file");

    app.add_option("--seq-len,--seq-length", T, "Training sequence length per rank")->check(CLI::PositiveNumber);
    app.add_option("--steps", MaxSteps, "Number of training steps")->check(CLI::PositiveNumber);
    app.add_option("--seed", Seed, "Seed for the weight initialization");

    // model
    app.add_option("--vocab-size", Model.VocabSize, "Vocabulary size; the LM head is padded to a multiple of 128")->check(CLI::PositiveNumber);
    app.add_option("--model-dim", Model.ModelDim, "Model (residual stream) dimension")->check(CLI::PositiveNumber);
    app.add_option("--num-layers", Model.NumLayers, "Number of residual MLP blocks")->check(CLI::PositiveNumber);

    // optimizer
    app.add_option("--muon-lr", Optimizer.muon_lr, "Muon learning rate of the hidden matrices")->check(CLI::NonNegativeNumber);
    app.add_flag("--nesterov,!--no-nesterov", Optimizer.nesterov, "Use Nesterov momentum in Muon");
    app.add_option("--w-max", Optimizer.w_max, "Spectral-norm cap of the hidden matrices (RMS->RMS)")->check(CLI::PositiveNumber);
    app.add_flag("--lm-head-muon,!--lm-head-adam", Optimizer.lm_head_muon, "Optimize the LM head with Muon instead of AdamW");
    app.add_option("--lm-head-lr", Optimizer.lm_head_lr, "Learning rate of the LM head")->check(CLI::NonNegativeNumber);
    app.add_option("--lm-head-w-max", Optimizer.lm_head_w_max, "Norm cap of the LM head")->check(CLI::PositiveNumber);
    app.add_option("--emb-w-max", Optimizer.emb_w_max, "RMS cap of the embedding rows")->check(CLI::PositiveNumber);
    app.add_option("--adam-lr", Optimizer.adam_lr, "AdamW learning rate of the embeddings")->check(CLI::NonNegativeNumber);
    app.add_option("--beta-1", Optimizer.adam_beta1, "Beta 1 for Adam")->check(CLI::NonNegativeNumber);
    app.add_option("--beta-2", Optimizer.adam_beta2, "Beta 2 for Adam")->check(CLI::NonNegativeNumber);
    app.add_option("--adam-epsilon", Optimizer.adam_epsilon, "Epsilon to use for AdamW")->check(CLI::NonNegativeNumber);
    app.add_option("--ns-coefficients", Optimizer.ns_coefficients, "Newton-Schulz coefficient table")
        ->check(CLI::IsMember(optimizers::coefficient_table_names()));
    app.add_option("--power-iterations", Optimizer.power_iterations, "Power-iteration steps of the spectral-norm estimate")->check(CLI::PositiveNumber);

    // schedules
    app.add_option("--cooldown-frac", CooldownFrac, "Fraction of training spent cooling down the learning rate")->check(CLI::Range(0.f, 1.f));
    app.add_option("--lr-floor", LrFloor, "Learning-rate multiplier at the end of training")->check(CLI::NonNegativeNumber);
    app.add_option("--momentum-warmup-steps", MomentumWarmupSteps, "Steps to ramp the Muon momentum")->check(CLI::NonNegativeNumber);
    app.add_option("--momentum-start", MomentumStart, "Muon momentum at step 0")->check(CLI::Range(0.f, 1.f));
    app.add_option("--momentum-end", MomentumEnd, "Muon momentum after the warmup")->check(CLI::Range(0.f, 1.f));

    // data
    app.add_option("--train-file", TrainFile, "Glob of token files for training");
    app.add_option("--eval-file", EvalFile, "Glob of token files for validation");
    app.add_option("--eval-tokens", EvalTokens, "Tokens per evaluation, over all ranks")->check(CLI::PositiveNumber);
    app.add_option("--eval-every", EvalEvery, "How many optimizer steps between evaluations")->check(CLI::NonNegativeNumber);

    // output
    app.add_option("--name", RunName, "Associate a name with this run. You can use %n as part of specifying log, output, and checkpoint file names.");
    app.add_option("--out-dir", OutDir, "Where to save the trained model");
    app.add_option("--checkpoint-dir", CkptDir, "Directory in which to save checkpoints.");
    app.add_option("--ckpt-interval", CkptEvery, "How many optimizer steps between checkpoints")->check(CLI::NonNegativeNumber);
    app.add_option("--ckpt-keep-n", CkptToKeep, "Clean up old checkpoints, only preserving the latest n.");
    app.add_flag("--continue", ContinueFromCheckpoint, "Continue from the latest checkpoint in --checkpoint-dir.");
    app.add_option("--log-file", LogFile, "Where to save the training log");
    app.add_option("--log-verbosity", LogVerbosity, "Console verbosity: -2 silent, -1 quiet, 0 default, 1 verbose")->check(CLI::Range(-2, 1));

    // distribution
    app.add_option("--gpus", NGPUs, "How many GPUs to use for training. 0 uses all local devices.")->check(CLI::NonNegativeNumber);
    app.add_flag("--memcpy-all-gather", MemcpyAllGather, "Use memcpy to perform all-gathers.");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    LogFile = expand_run_name(LogFile, RunName);
    OutDir = expand_run_name(OutDir, RunName);
    CkptDir = expand_run_name(CkptDir, RunName);
}

void TrainingRunner::launch_training(int argc, const char** argv) {
    NCCLCommunicator::run_communicators(NGPUs, MemcpyAllGather,
                                        [&](NCCLCommunicator& comm) { run_training(argc, argv, comm); });
}

void TrainingRunner::run_training(int argc, const char** argv, NCCLCommunicator& comm) {
    const int world = comm.world_size();
    const long batch_tokens = (long)world * T;
    if (EvalTokens % batch_tokens != 0) {
        throw std::invalid_argument(fmt::format("--eval-tokens ({}) must be a multiple of world size * seq len ({})",
                                                EvalTokens, batch_tokens));
    }

    TrainingRunLogger logger(LogFile, comm.rank(), static_cast<TrainingRunLogger::EVerbosity>(LogVerbosity));
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"name",                   RunName},
        {"seq-len",                (std::int64_t)T},
        {"steps",                  (std::int64_t)MaxSteps},
        {"vocab-size",             (std::int64_t)Model.VocabSize},
        {"model-dim",              (std::int64_t)Model.ModelDim},
        {"num-layers",             (std::int64_t)Model.NumLayers},
        {"muon-lr",                Optimizer.muon_lr},
        {"nesterov",               Optimizer.nesterov},
        {"w-max",                  Optimizer.w_max},
        {"lm-head-muon",           Optimizer.lm_head_muon},
        {"lm-head-lr",             Optimizer.lm_head_lr},
        {"lm-head-w-max",          Optimizer.lm_head_w_max},
        {"emb-w-max",              Optimizer.emb_w_max},
        {"adam-lr",                Optimizer.adam_lr},
        {"ns-coefficients",        Optimizer.ns_coefficients},
        {"cooldown-frac",          CooldownFrac},
        {"lr-floor",               LrFloor},
        {"momentum-warmup-steps",  (std::int64_t)MomentumWarmupSteps},
        {"momentum-start",         MomentumStart},
        {"momentum-end",           MomentumEnd},
        {"eval-tokens",            (std::int64_t)EvalTokens},
        {"eval-every",             (std::int64_t)EvalEvery},
        {"memcpy-all-gather",      MemcpyAllGather},
        {"world",                  (std::int64_t)world},
    });
    logger.log_gpu_model(comm);

    DataLoader train_loader(TrainFile, T, comm.rank(), world, Model.VocabSize);
    DataLoader eval_loader(EvalFile, T, comm.rank(), world, Model.VocabSize);
    logger.log_dataset(train_loader, eval_loader);
    logger.set_training_tokens((long)MaxSteps * batch_tokens);

    auto allocator = std::make_shared<TensorAllocator>();
    ResidualMLPModel model(Model, T, Optimizer, comm, allocator);
    logger.log_allocator(allocator->get_context_stats());

    int latest_step = -1;
    if (ContinueFromCheckpoint) {
        latest_step = find_latest_checkpoint(CkptDir);
    }
    if (latest_step >= 0) {
        auto log = logger.log_section_start(0, fmt::format("Loading checkpoint {} from `{}`", latest_step, CkptDir));
        if (int ws = get_checkpoint_world_size(CkptDir, latest_step); ws != world) {
            logger.log_message(0, fmt::format("Checkpoint was written with {} ranks, redistributing momentum over {}", ws, world));
        }
        load_checkpoint(CkptDir, latest_step, model, &train_loader, comm);
    } else {
        auto log = logger.log_section_start(0, "Initializing model from scratch");
        model.init_weights(Seed);
        latest_step = 0;
    }

    StableDecaySchedule lr_schedule(MaxSteps, CooldownFrac, LrFloor);
    MomentumWarmupSchedule momentum_schedule(MomentumWarmupSteps, MomentumStart, MomentumEnd);

    logger.log_message(0, fmt::format("Starting training for {} steps", MaxSteps));
    logger.log_message(0, fmt::format("Setup took {} seconds",
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - BeginStartup).count()));

    // one extra iteration that only evaluates
    for (int step = latest_step; step <= MaxSteps; ++step) {
        const bool last_step = step == MaxSteps;

        if (last_step || (EvalEvery > 0 && step % EvalEvery == 0)) {
            run_evaluation(model, eval_loader, logger, step, comm);
        }

        if (CkptEvery > 0 && step % CkptEvery == 0 && step > latest_step && !CkptDir.empty()) {
            auto log = logger.log_section_start(step, fmt::format("saving checkpoint to `{}`", CkptDir));
            save_checkpoint(CkptDir, step, model, &train_loader, comm, RunName);
            if(CkptToKeep > 0) {
                auto cleaned = clean_old_checkpoints(CkptDir, CkptToKeep);
                logger.log_message(0, fmt::format("Cleaned {} checkpoints", cleaned.size()));
            }
        }

        if (last_step) {
            break;
        }

        NvtxRange range("step");
        auto start = std::chrono::high_resolution_clock::now();

        optimizers::StepParameters params;
        params.LearningRateScale = lr_schedule.eval(step);
        params.Momentum = momentum_schedule.eval(step);
        params.Step = step;

        train_loader.load_batch(model.input_buffer(), model.target_buffer());
        model.forward_backward(comm);
        model.update(params);
        float step_loss = model.get_loss();

        auto end = std::chrono::high_resolution_clock::now();
        long ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        logger.log_step(step, train_loader.epoch(), batch_tokens, narrow<int>(ms), step_loss, params.LearningRateScale);
    }

    if (!OutDir.empty()) {
        auto log = logger.log_section_start(MaxSteps, fmt::format("Saving model to `{}`", OutDir));
        std::filesystem::create_directories(OutDir);
        write_safetensors((std::filesystem::path(OutDir) / "model.safetensors").string(), model.weights(), comm);
    }
}

/**
 * @brief Evaluate on the first `EvalTokens` tokens of the validation set and report weight norms.
 *
 * The eval loader is reset to the start of the data on every call, so all evaluations of one run
 * see the same tokens.
 */
void TrainingRunner::run_evaluation(ResidualMLPModel& model, DataLoader& eval_loader, TrainingRunLogger& logger,
                                    int step, NCCLCommunicator& comm) {
    NvtxRange range("validate");

    // every rank runs the power iterations, only rank 0 prints
    std::vector<WeightNormRecord> norms = model.weight_norms();
    logger.log_weight_norms(step, norms);
    logger.log_degenerate_sigma(step, model.muon().degenerate_count());

    auto start = std::chrono::high_resolution_clock::now();
    const int batches = static_cast<int>(EvalTokens / ((long)comm.world_size() * T));
    auto [loss, accuracy] = model.evaluate(eval_loader, batches, comm);
    auto end = std::chrono::high_resolution_clock::now();
    long ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    logger.log_eval(step, narrow<int>(EvalTokens), narrow<int>(ms), loss, accuracy);
}

int main(int argc, const char** argv) {
    try {
        TrainingRunner runner;
        runner.load_training_config(argc, argv);
        runner.launch_training(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
