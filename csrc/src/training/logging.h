// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_TRAINING_LOGGING_H
#define SPECTRON_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

class NCCLCommunicator;
class DataLoader;

//! Operator norms of one weight matrix, as reported at evaluation time.
struct WeightNormRecord {
    std::string Name;
    std::string Kind;       //!< "l1->RMS", "RMS->INF" or "RMS->RMS"
    float Value;
    float RmsToRms;         //!< always reported, equals Value for hidden matrices
};

class TrainingRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~TrainingRunLogger();

    void set_training_tokens(long total_tokens);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_gpu_model(NCCLCommunicator& comm);
    void log_dataset(const DataLoader& train_loader, const DataLoader& eval_loader);
    void log_step(int step, int epoch, long step_tokens, int duration_ms, float loss, float lr);
    void log_eval(int step, int eval_tokens, int duration_ms, float loss, float accuracy);
    void log_weight_norms(int step, const std::vector<WeightNormRecord>& norms);
    void log_degenerate_sigma(int step, int count);
    //! Device memory per allocator context, as returned by TensorAllocator::get_context_stats().
    void log_allocator(const std::vector<std::pair<std::string, std::size_t>>& context_stats);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(TrainingRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        TrainingRunLogger* mLogger;

        friend class TrainingRunLogger;
    };

    void log_message(int step, const std::string& msg);
    RAII_Section log_section_start(int step, const std::string& info);
    void log_section_end();
private:
    //! Appends @p record to the JSON array in the log file.
    void log_line(const nlohmann::json& record);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // running mean for training loss
    double mTotalTrainingLoss = 0.0;
    int mTotalTrainingSteps = 0;
    float mPreviousLoss = -1.f;

    // to estimate ETA
    long mTotalTokens = -1;
    long mRemainingTokens = -1;
    std::chrono::steady_clock::time_point mTrainingStartTime;

    // last reported count of degenerate spectral-norm estimates
    int mDegenerateCount = 0;

    // pending section, closed by log_section_end()
    std::string mSectionInfo;
    int mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //SPECTRON_SRC_TRAINING_LOGGING_H
