// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_SAFETENSORS_H
#define SPECTRON_SRC_UTILITIES_SAFETENSORS_H

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "dtype.h"
#include "tensor_container.h"

struct Tensor;
class NCCLCommunicator;
class SafeTensorsReader;

//! A single tensor inside a safetensors file.
class SafeTensorEntry {
public:
    SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype,
                    const SafeTensorsReader* reader, std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }

    /**
     * @brief Copy the tensor into @p target (host or device memory).
     * @throws std::runtime_error If shape or dtype of @p target differ from the file.
     */
    void read_tensor(Tensor& target) const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    const SafeTensorsReader* mReader;
    std::ptrdiff_t mDataBegin;
    std::ptrdiff_t mDataEnd;
};

class SafeTensorsReader {
public:
    explicit SafeTensorsReader(std::string file_name);
    ~SafeTensorsReader();

    SafeTensorsReader(const SafeTensorsReader&) = delete;
    SafeTensorsReader& operator=(const SafeTensorsReader&) = delete;

    //! Load every tensor of @p container from the entry of the same name; all of them must be present.
    void load_tensors(ITensorContainer& container) const;

    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    [[nodiscard]] const std::string& file_name() const { return mFileName; }

private:
    friend class SafeTensorEntry;

    void read_bytes(std::byte* target, int device, std::ptrdiff_t begin, std::ptrdiff_t end) const;

    std::string mFileName;
    std::vector<SafeTensorEntry> mEntries;

    // pinned staging buffer for host -> device uploads
    mutable std::byte* mStaging = nullptr;
    mutable std::size_t mStagingSize = 0;
};

void load_safetensors(const std::string& file_name, ITensorContainer& tensors);

//! Writes through `<file_name>.tmp`, so a crash never leaves a truncated file under the final name.
void write_safetensors(const std::string& file_name, ITensorContainer& tensors);

//! Collective variant for replicated tensors: every rank must call it, rank 0 writes the file.
void write_safetensors(const std::string& file_name, ITensorContainer& tensors, NCCLCommunicator& comm);

#endif //SPECTRON_SRC_UTILITIES_SAFETENSORS_H
