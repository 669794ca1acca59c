// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_RUNTIME_TRAINING_DATALOADER_H
#define SPECTRON_SRC_RUNTIME_TRAINING_DATALOADER_H

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

struct Tensor;

/*!
 * \brief The DataLoader streams pre-tokenized data from a sorted list of shard files.
 * \details Each shard file starts with a header of 256 int32 words (magic 20240520, version 1,
 * token count), followed by the tokens as uint16.
 *
 * All ranks walk through the files in lockstep. At position `pos`, rank `r` reads the window
 * [pos + r * seq_len, pos + (r + 1) * seq_len + 1), whose first seq_len tokens are the inputs and
 * whose last seq_len tokens are the targets. After each batch, `pos` advances by world * seq_len.
 * Once `pos + world * seq_len + 1 >= num_tokens`, the remainder of the file is dropped and the loader
 * moves to the next file; after the last file, it starts the next epoch at the first one.
 * The full state is therefore characterized by three numbers: epoch, file index and position.
 */
class DataLoader {
public:
    DataLoader(const std::string& file_pattern, int seq_len, int rank, int world_size, int vocab_size = kMaxVocabSize);
    DataLoader(const std::vector<std::string>& file_list, int seq_len, int rank, int world_size, int vocab_size = kMaxVocabSize);

    static std::vector<std::string> match_files(const std::string& pattern);

    //! Fills `inputs` and `targets` (host INT32 tensors of seq_len elements) with the next window.
    //! @throws std::runtime_error If the window holds a token id >= vocab_size.
    void load_batch(Tensor& inputs, Tensor& targets);

    //! Number of batches left in the current file.
    [[nodiscard]] std::int64_t batches_left_in_file() const;

    const std::string& file_name(int i) const { return mFileInfos.at(i).FileName; }
    std::int64_t file_tokens(int i) const { return mFileInfos.at(i).NumTokens; }
    int seq_len() const { return mSeqLen; }
    int vocab_size() const { return mVocabSize; }

    std::int32_t epoch() const { return mEpoch; }
    std::int32_t file_index() const { return mFileIndex; }
    std::int64_t position() const { return mPosition; }

    std::size_t num_files() const { return mFileInfos.size(); }
    std::int64_t num_tokens() const { return mTotalTokens; }

    //! Percentage of the current epoch's tokens that have been consumed.
    float progress() const;

    //! @throws std::out_of_range If the state does not describe a valid position.
    void set_state(std::int32_t epoch, std::int32_t file_index, std::int64_t position);

    struct TokenFileInfo {
        std::string FileName;
        std::int64_t NumTokens;
    };

    //! @throws std::runtime_error If the header is invalid or the file is shorter than it claims.
    static TokenFileInfo parse_token_file_header(const std::string& file_name);

    static constexpr std::int32_t kMagic = 20240520;
    static constexpr std::int32_t kVersion = 1;
    static constexpr long kHeaderBytes = 256 * sizeof(std::int32_t);
    static constexpr int kMaxVocabSize = 1 << 16;

private:
    void open_file(std::int32_t index);
    void advance_file();

    // immutable config
    std::int32_t mSeqLen;
    int mVocabSize;
    std::vector<TokenFileInfo> mFileInfos;
    int mRank;
    int mWorldSize;
    std::int64_t mTotalTokens = 0;

    // state
    std::ifstream mTokenFile;
    std::int32_t mEpoch = 0;
    std::int32_t mFileIndex = 0;
    std::int64_t mPosition = 0;

    // buffers
    std::vector<std::uint16_t> mReadBuffer;
};

#endif //SPECTRON_SRC_RUNTIME_TRAINING_DATALOADER_H
