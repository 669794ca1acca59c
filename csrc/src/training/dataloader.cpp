// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "runtime/training/dataloader.h"

#include <glob.h>

#include <algorithm>
#include <filesystem>

#include <fmt/core.h>

#include "utilities/tensor.h"

/**
 * @brief Construct a DataLoader from a glob pattern.
 *
 * Matches files using @p file_pattern, then delegates to the file-list constructor.
 *
 * @param file_pattern Glob pattern for token files (e.g. "/path/fineweb_train_*.bin").
 * @param seq_len Sequence length (number of tokens) per rank and batch.
 * @param rank Local process rank in [0, world_size).
 * @param world_size Total number of participating ranks.
 * @param vocab_size Exclusive upper bound for token ids; batches with larger ids are rejected.
 */
DataLoader::DataLoader(const std::string& file_pattern, int seq_len, int rank, int world_size, int vocab_size) :
       DataLoader(match_files(file_pattern), seq_len, rank, world_size, vocab_size) {

}

/**
 * @brief Construct a DataLoader from an explicit list of token files.
 *
 * Parses the headers of all files and opens the first one.
 *
 * @throws std::runtime_error If @p file_list is empty, a header is invalid, or a file is too short
 * to provide a single batch for all ranks.
 */
DataLoader::DataLoader(const std::vector<std::string>& file_list, int seq_len, int rank, int world_size, int vocab_size) :
        mSeqLen(seq_len), mVocabSize(vocab_size), mRank(rank), mWorldSize(world_size) {
    if (file_list.empty()) {
        throw std::runtime_error("Empty list of token files provided");
    }
    if (seq_len <= 0 || world_size <= 0 || rank < 0 || rank >= world_size) {
        throw std::runtime_error(fmt::format("Invalid data loader configuration: seq_len {}, rank {}, world {}", seq_len, rank, world_size));
    }
    if (vocab_size <= 0 || vocab_size > kMaxVocabSize) {
        throw std::runtime_error(fmt::format("Invalid vocabulary size {} for uint16 token files", vocab_size));
    }

    const std::int64_t batch_tokens = static_cast<std::int64_t>(world_size) * seq_len;
    for (const auto& file_name : file_list) {
        TokenFileInfo info = parse_token_file_header(file_name);
        if (batch_tokens + 1 >= info.NumTokens) {
            throw std::runtime_error(fmt::format("Token file '{}' has {} tokens, need more than {} for one batch",
                                                 file_name, info.NumTokens, batch_tokens + 1));
        }
        mTotalTokens += info.NumTokens;
        mFileInfos.push_back(std::move(info));
    }

    mReadBuffer.resize(mSeqLen + 1);
    open_file(0);
}

/**
 * @brief Expand a glob pattern into a sorted list of file paths.
 *
 * @throws std::runtime_error If glob fails or no files match.
 */
std::vector<std::string> DataLoader::match_files(const std::string& pattern) {
    std::vector<std::string> files;

    glob_t glob_result;
    int ret = glob(pattern.c_str(), GLOB_TILDE | GLOB_BRACE, nullptr, &glob_result);

    if (ret == 0 || ret == GLOB_NOMATCH) {
        for (size_t i = 0; i < glob_result.gl_pathc; ++i) {
            files.emplace_back(glob_result.gl_pathv[i]);
        }
        std::ranges::sort(files);
    } else {
        globfree(&glob_result);
        throw std::runtime_error(fmt::format("Failed to match files with pattern '{}' (glob error {})", pattern, ret));
    }

    globfree(&glob_result);

    if (files.empty()) {
        throw std::runtime_error(fmt::format("No files found with pattern '{}'", pattern));
    }

    return files;
}

DataLoader::TokenFileInfo DataLoader::parse_token_file_header(const std::string& file_name) {
    std::ifstream token_file(file_name, std::ios::binary);
    if (!token_file.is_open() || !token_file.good()) {
        throw std::runtime_error("Could not open token file: " + file_name);
    }

    std::int32_t header[256];
    token_file.read(reinterpret_cast<char*>(header), sizeof(header));
    if (token_file.gcount() != static_cast<std::streamsize>(sizeof(header))) {
        throw std::runtime_error(fmt::format("Token file '{}' is too short for a header", file_name));
    }
    if (header[0] != kMagic) {
        throw std::runtime_error(fmt::format("Invalid token file '{}': magic number {} does not match {}", file_name, header[0], kMagic));
    }
    if (header[1] != kVersion) {
        throw std::runtime_error(fmt::format("Unsupported token file version {} in '{}'", header[1], file_name));
    }
    if (header[2] < 0) {
        throw std::runtime_error(fmt::format("Invalid token count {} in '{}'", header[2], file_name));
    }

    TokenFileInfo info{.FileName = file_name, .NumTokens = header[2]};

    const auto file_size = std::filesystem::file_size(file_name);
    const auto expected = static_cast<std::uintmax_t>(kHeaderBytes + info.NumTokens * sizeof(std::uint16_t));
    if (file_size < expected) {
        throw std::runtime_error(fmt::format("Token file '{}' claims {} tokens but has only {} bytes (expected {})",
                                             file_name, info.NumTokens, file_size, expected));
    }
    return info;
}

void DataLoader::open_file(std::int32_t index) {
    const std::string& file_name = mFileInfos.at(index).FileName;
    mTokenFile = std::ifstream(file_name, std::ios::binary);
    if (!mTokenFile.is_open() || !mTokenFile.good()) {
        throw std::runtime_error("Could not open token file: " + file_name);
    }
    mTokenFile.exceptions(std::ifstream::failbit);
    mFileIndex = index;
    mPosition = 0;
}

/**
 * @brief Move to the next file, or to the first file of the next epoch after the last one.
 */
void DataLoader::advance_file() {
    if (mFileIndex + 1 >= static_cast<std::int32_t>(mFileInfos.size())) {
        ++mEpoch;
        open_file(0);
    } else {
        open_file(mFileIndex + 1);
    }
}

std::int64_t DataLoader::batches_left_in_file() const {
    const std::int64_t step = static_cast<std::int64_t>(mWorldSize) * mSeqLen;
    const std::int64_t tokens = mFileInfos.at(mFileIndex).NumTokens;
    std::int64_t count = 0;
    for (std::int64_t pos = mPosition; pos + step + 1 < tokens; pos += step) {
        ++count;
    }
    return count;
}

float DataLoader::progress() const {
    std::int64_t epoch_tokens = mPosition;
    for (int i = 0; i < mFileIndex; ++i) {
        epoch_tokens += mFileInfos.at(i).NumTokens;
    }
    return 100.f * ((double)epoch_tokens / (double)mTotalTokens);
}

/**
 * @brief Load the next window of this rank.
 *
 * @param inputs Host INT32 tensor with exactly seq_len elements.
 * @param targets Host INT32 tensor with exactly seq_len elements.
 *
 * @throws std::runtime_error On size/device mismatch or I/O errors.
 */
void DataLoader::load_batch(Tensor& inputs, Tensor& targets) {
    if (inputs.Device != -1 || targets.Device != -1) {
        throw std::runtime_error("DataLoader::load_batch: expected host tensors");
    }
    if (inputs.nelem() != mSeqLen) {
        throw std::runtime_error(fmt::format("Expected inputs tensor of {} elements, got {}", mSeqLen, inputs.nelem()));
    }
    if (targets.nelem() != mSeqLen) {
        throw std::runtime_error(fmt::format("Expected targets tensor of {} elements, got {}", mSeqLen, targets.nelem()));
    }

    const std::int64_t batch_tokens = static_cast<std::int64_t>(mWorldSize) * mSeqLen;
    if (mPosition + batch_tokens + 1 >= mFileInfos.at(mFileIndex).NumTokens) {
        advance_file();
    }

    try {
        const std::int64_t offset = kHeaderBytes + (mPosition + static_cast<std::int64_t>(mRank) * mSeqLen) * sizeof(std::uint16_t);
        const std::streamsize bytes = static_cast<std::streamsize>(mReadBuffer.size() * sizeof(std::uint16_t));
        mTokenFile.seekg(offset, std::ios::beg);
        mTokenFile.read(reinterpret_cast<char*>(mReadBuffer.data()), bytes);
        if (mTokenFile.gcount() != bytes) {
            throw std::runtime_error(fmt::format("Incomplete read from '{}': expected {} bytes, got {}",
                                                 mFileInfos.at(mFileIndex).FileName, bytes, mTokenFile.gcount()));
        }
    } catch (const std::ios_base::failure& e) {
        throw std::runtime_error(fmt::format("File I/O error in '{}': {}", mFileInfos.at(mFileIndex).FileName, e.what()));
    }

    // ids outside the vocabulary would index past the embedding and logits on the device
    for (std::size_t i = 0; i < mReadBuffer.size(); ++i) {
        if (mReadBuffer[i] >= mVocabSize) {
            throw std::runtime_error(fmt::format("Token {} at position {} of '{}' is outside the vocabulary of size {}",
                                                 mReadBuffer[i], mPosition + static_cast<std::int64_t>(mRank) * mSeqLen + i,
                                                 mFileInfos.at(mFileIndex).FileName, mVocabSize));
        }
    }

    std::int32_t* in = inputs.get<std::int32_t>();
    std::int32_t* tgt = targets.get<std::int32_t>();
    for (int i = 0; i < mSeqLen; ++i) {
        in[i] = mReadBuffer[i];
        tgt[i] = mReadBuffer[i + 1];
    }

    // Update position only after successful reads
    mPosition += batch_tokens;
}

/**
 * @brief Restore loader state for deterministic resumption.
 */
void DataLoader::set_state(std::int32_t epoch, std::int32_t file_index, std::int64_t position) {
    if (epoch < 0 || file_index < 0 || file_index >= static_cast<std::int32_t>(mFileInfos.size())) {
        throw std::out_of_range(fmt::format("Invalid data loader state: epoch {}, file {}", epoch, file_index));
    }
    if (position < 0 || position >= mFileInfos.at(file_index).NumTokens) {
        throw std::out_of_range(fmt::format("Invalid data loader position {} in file {}", position, file_index));
    }
    mEpoch = epoch;
    open_file(file_index);
    mPosition = position;
}
