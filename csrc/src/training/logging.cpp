// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>

#include <cuda_runtime.h>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "runtime/training/dataloader.h"
#include "utilities/comm.h"
#include "utilities/utils.h"

namespace {

//! Common fields of every log record.
nlohmann::json make_record(const char* kind, int step) {
    return {
        {"log", kind},
        {"time", fmt::format("{:%FT%T}", std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()))},
        {"step", step},
    };
}

std::string fmt_token_count(long num_tokens) {
    if (num_tokens < 1'000'000) {
        return fmt::format("{:4d}k", num_tokens / 1'000);
    }
    if (num_tokens < 1'000'000'000) {
        return fmt::format("{:5.1f}M", num_tokens / 1e6);
    }
    return fmt::format("{:5.1f}B", num_tokens / 1e9);
}

std::string fmt_mib(std::size_t bytes) {
    return fmt::format("{:8.1f} MiB", bytes / 1024.0 / 1024.0);
}

} // namespace

/**
 * @brief Create a logger; only rank 0 writes the JSON log file.
 *
 * The file always holds a complete JSON array, so it can be parsed while training is running.
 */
TrainingRunLogger::TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if (mRank != 0) {
        return;
    }
    const auto directory = std::filesystem::path(mFileName).parent_path();
    if (!directory.empty()) {
        std::filesystem::create_directories(directory);
    }
    mLogFile.open(mFileName, std::fstream::out | std::fstream::trunc);
    if (!mLogFile.is_open()) {
        throw std::runtime_error(fmt::format("Could not open log file '{}'", mFileName));
    }
    mLogFile << "[\n]\n" << std::flush;
}

TrainingRunLogger::~TrainingRunLogger() = default;

void TrainingRunLogger::log_line(const nlohmann::json& record) {
    if (!mLogFile.is_open()) {
        return;
    }
    // overwrite the closing bracket; the previous record keeps its line
    if (mFirst) {
        mLogFile.seekp(-2, std::ios::end);
        mLogFile << "  ";
    } else {
        mLogFile.seekp(-3, std::ios::end);
        mLogFile << ",\n  ";
    }
    mLogFile << record.dump() << "\n]\n" << std::flush;
    mFirst = false;
}

void TrainingRunLogger::log_cmd(int argc, const char** argv) {
    if (mRank != 0) return;
    auto record = make_record("cmd", 0);
    record["cmd"] = std::vector<std::string>(argv, argv + argc);
    log_line(record);
}

void TrainingRunLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    if (mRank != 0) return;

    std::size_t width = 0;
    for (const auto& [name, value] : options) {
        width = std::max(width, name.size());
    }
    if (mVerbosity >= VERBOSE) {
        printf("[Options]\n");
    }
    for (const auto& [name, value] : options) {
        std::visit([&](const auto& v) {
            auto record = make_record("option", 0);
            record["name"] = std::string(name);
            record["value"] = v;
            log_line(record);
            if (mVerbosity >= VERBOSE) {
                fmt::print("  {:<{}} : {}\n", name, width, v);
            }
        }, value);
    }
    if (mVerbosity >= VERBOSE) {
        printf("\n");
    }
}

/**
 * @brief Log the device name of every rank; collective, must be called on all ranks.
 */
void TrainingRunLogger::log_gpu_model(NCCLCommunicator& comm) {
    struct sDeviceName {
        char Name[256];
    };
    int device = 0;
    CUDA_CHECK(cudaGetDevice(&device));
    cudaDeviceProp props{};
    CUDA_CHECK(cudaGetDeviceProperties(&props, device));
    sDeviceName local{};
    std::snprintf(local.Name, sizeof(local.Name), "%s", props.name);

    const auto names = comm.host_gather(local);
    if (mRank != 0) return;

    if (mVerbosity >= DEFAULT) {
        printf("[GPU]\n");
    }
    for (int r = 0; r < static_cast<int>(names.size()); ++r) {
        auto record = make_record("gpu-model", 0);
        record["rank"] = r;
        record["name"] = names[r].Name;
        log_line(record);
        if (mVerbosity >= DEFAULT) {
            printf("  %2d: %s\n", r, names[r].Name);
        }
    }
    if (mVerbosity >= DEFAULT) {
        printf("\n");
    }
}

void TrainingRunLogger::log_dataset(const DataLoader& train_loader, const DataLoader& eval_loader) {
    if (mRank != 0) return;

    for (const auto& [split, loader] : {std::pair{"train", &train_loader}, std::pair{"eval", &eval_loader}}) {
        auto record = make_record("dataset", 0);
        record["split"] = split;
        record["files"] = loader->num_files();
        record["tokens"] = loader->num_tokens();
        record["epoch"] = loader->epoch();
        record["file_index"] = loader->file_index();
        record["position"] = loader->position();
        log_line(record);

        if (mVerbosity < DEFAULT) {
            continue;
        }
        if (std::string_view(split) == "train") {
            printf("[Dataset]\n");
        }
        fmt::print(" {}: {} tokens\n", split, fmt_token_count(loader->num_tokens()));
        const int shown = mVerbosity >= VERBOSE ? static_cast<int>(loader->num_files()) : std::min<int>(10, loader->num_files());
        for (int i = 0; i < shown; ++i) {
            fmt::print("   {} : {:>10}\n", loader->file_name(i), loader->file_tokens(i));
        }
    }
    if (mVerbosity >= DEFAULT) {
        printf("\n");
    }
}

void TrainingRunLogger::log_allocator(const std::vector<std::pair<std::string, std::size_t>>& context_stats) {
    if (mRank != 0) return;

    auto record = make_record("allocator", 0);
    record["stats"] = nlohmann::json::array();
    std::size_t total = 0;
    for (const auto& [name, bytes] : context_stats) {
        record["stats"].push_back({{"name", name}, {"device", bytes}});
        total += bytes;
    }
    log_line(record);

    if (mVerbosity >= VERBOSE) {
        printf("[Allocator]\n");
        for (const auto& [name, bytes] : context_stats) {
            fmt::print("  {:<16} {}\n", name, fmt_mib(bytes));
        }
        fmt::print("  {:<16} {}\n\n", "total", fmt_mib(total));
    }
}

void TrainingRunLogger::set_training_tokens(long total_tokens) {
    mTotalTokens = total_tokens;
    mRemainingTokens = total_tokens;
    mTrainingStartTime = std::chrono::steady_clock::now();
}

/**
 * @brief Log one optimizer step.
 *
 * The console line carries a loss trend marker, throughput and, once set_training_tokens()
 * has been called, an ETA extrapolated from the average throughput so far.
 */
void TrainingRunLogger::log_step(int step, int epoch, long step_tokens, int duration_ms, float loss, float lr) {
    if (mRank != 0) return;
    mTotalTrainingLoss += loss;
    ++mTotalTrainingSteps;

    auto record = make_record("step", step);
    record["epoch"] = epoch;
    record["step_tokens"] = step_tokens;
    record["duration_ms"] = duration_ms;
    record["loss"] = loss;
    record["lr"] = lr;
    log_line(record);

    const char trend = mPreviousLoss < 0.f || loss == mPreviousLoss ? ' ' : (loss < mPreviousLoss ? '\\' : '/');
    mPreviousLoss = loss;

    std::string eta;
    if (mTotalTokens > 0) {
        mRemainingTokens -= step_tokens;
        const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - mTrainingStartTime).count();
        const long processed = mTotalTokens - mRemainingTokens;
        if (mRemainingTokens > 0 && processed > 0 && elapsed_ms > 0) {
            const auto eta_min = static_cast<long>(static_cast<double>(mRemainingTokens) * elapsed_ms / processed / 60'000.0);
            eta = fmt::format(" | eta {:02d}h{:02d}m", eta_min / 60, eta_min % 60);
        }
    }

    if (mVerbosity >= DEFAULT) {
        const double ktps = duration_ms > 0 ? static_cast<double>(step_tokens) / duration_ms : 0.0;
        fmt::print(":: step {:7d} [ep {:2d}] {} loss {:6.4f} | lr {:6.4f} | {:5.1f}k tps | {:5d} ms{}\n",
                   step, epoch, trend, loss, lr, ktps, duration_ms, eta);
        std::fflush(stdout);
    }
}

/**
 * @brief Log an evaluation; the gap is measured against the mean training loss since the last evaluation.
 */
void TrainingRunLogger::log_eval(int step, int eval_tokens, int duration_ms, float loss, float accuracy) {
    if (mRank != 0) return;

    auto record = make_record("eval", step);
    record["eval_tokens"] = eval_tokens;
    record["duration_ms"] = duration_ms;
    record["loss"] = loss;
    record["accuracy"] = accuracy;
    log_line(record);

    if (mVerbosity >= QUIET) {
        const float gap = mTotalTrainingSteps > 0 ? loss - static_cast<float>(mTotalTrainingLoss / mTotalTrainingSteps) : 0.f;
        const double ktps = duration_ms > 0 ? static_cast<double>(eval_tokens) / duration_ms : 0.0;
        fmt::print("\x1b[1m>> eval {:7d}          loss {:6.4f} | acc {:6.4f} | gap {:+7.4f} | {:5.1f}k tps | {:5d} ms\x1b[22m\n",
                   step, loss, accuracy, gap, ktps, duration_ms);
        std::fflush(stdout);
    }
    mTotalTrainingLoss = 0.0;
    mTotalTrainingSteps = 0;
}

void TrainingRunLogger::log_weight_norms(int step, const std::vector<WeightNormRecord>& norms) {
    if (mRank != 0) return;

    auto record = make_record("weight-norms", step);
    record["norms"] = nlohmann::json::array();
    for (const auto& norm : norms) {
        record["norms"].push_back({{"name", norm.Name}, {"kind", norm.Kind}, {"value", norm.Value}, {"rms_rms", norm.RmsToRms}});
    }
    log_line(record);

    if (mVerbosity >= DEFAULT) {
        printf("[Weight norms]\n");
        for (const auto& norm : norms) {
            fmt::print("  {:<24} {:<9} {:10.4f}", norm.Name, norm.Kind, norm.Value);
            if (norm.Kind != "RMS->RMS") {
                fmt::print(" | RMS->RMS {:10.4f}", norm.RmsToRms);
            }
            printf("\n");
        }
        printf("\n");
    }
}

/**
 * @brief Report the running count of non-finite spectral-norm estimates.
 *
 * Silent unless the count grew since the previous call.
 */
void TrainingRunLogger::log_degenerate_sigma(int step, int count) {
    if (mRank != 0 || count <= mDegenerateCount) return;
    const int added = count - mDegenerateCount;
    mDegenerateCount = count;

    auto record = make_record("warning", step);
    record["degenerate_sigma"] = added;
    record["total"] = count;
    log_line(record);

    if (mVerbosity >= QUIET) {
        fmt::print("WARNING: {} non-finite spectral norm estimate(s) at step {} ({} total); spectral cap skipped\n", added, step, count);
        std::fflush(stdout);
    }
}

void TrainingRunLogger::log_message(int step, const std::string& msg) {
    if (mRank != 0) return;
    auto record = make_record("info", step);
    record["message"] = msg;
    log_line(record);
    if (mVerbosity >= DEFAULT) {
        fmt::print("{}\n", msg);
    }
}

//! On ranks other than 0 the returned section is a no-op.
TrainingRunLogger::RAII_Section TrainingRunLogger::log_section_start(int step, const std::string& info) {
    if (mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if (mVerbosity >= DEFAULT) {
        fmt::print("{} ...\n", info);
    }
    return RAII_Section{this};
}

void TrainingRunLogger::log_section_end() {
    const long ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - mSectionStart).count();

    auto record = make_record("info", mSectionStep);
    record["message"] = mSectionInfo;
    record["duration_ms"] = ms;
    log_line(record);

    if (mVerbosity >= DEFAULT) {
        if (ms < 2000) {
            fmt::print("  done in {} ms\n\n", ms);
        } else {
            fmt::print("  done in {} s\n\n", ms / 1000);
        }
    }
}
