// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cuda_runtime.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include "comm.h"
#include "tensor.h"
#include "utils.h"

namespace {

constexpr std::size_t kMaxStagingBytes = 64 * 1024 * 1024;

//! Owns a POSIX file descriptor.
class FileHandle {
public:
    FileHandle(const std::string& path, int flags, mode_t mode = 0) : mPath(path), mFd(::open(path.c_str(), flags, mode)) {
        if (mFd == -1) {
            throw std::system_error(errno, std::system_category(), "Error opening '" + path + "'");
        }
    }
    ~FileHandle() {
        if (mFd >= 0) {
            ::close(mFd);
        }
    }
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    void read_at(std::byte* dst, std::size_t count, std::ptrdiff_t pos) const {
        while (count > 0) {
            const ssize_t got = ::pread(mFd, dst, count, pos);
            if (got <= 0) {
                throw std::system_error(got < 0 ? errno : EIO, std::system_category(),
                                        fmt::format("Error reading '{}' at offset {}", mPath, pos));
            }
            dst += got;
            pos += got;
            count -= static_cast<std::size_t>(got);
        }
    }

    void write_all(const std::byte* src, std::size_t count) {
        while (count > 0) {
            const ssize_t put = ::write(mFd, src, count);
            if (put < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::system_category(), "Error writing '" + mPath + "'");
            }
            src += put;
            count -= static_cast<std::size_t>(put);
        }
    }

    void close() {
        if (::close(std::exchange(mFd, -1)) != 0) {
            throw std::system_error(errno, std::system_category(), "Error closing '" + mPath + "'");
        }
    }

private:
    std::string mPath;
    int mFd;
};

/**
 * @brief Write every tensor of @p tensors into a safetensors file.
 *
 * Layout: little-endian u64 header length, JSON header (padded with spaces to a multiple of
 * eight bytes), then the tensor data in header order. Data offsets are relative to the end
 * of the header.
 */
void write_file(const std::string& file_name, ITensorContainer& tensors) {
    std::map<std::string, Tensor> sorted;
    tensors.iterate_tensors([&sorted](std::string name, const Tensor& tensor) {
        if (!sorted.emplace(std::move(name), tensor).second) {
            throw std::logic_error("write_safetensors: duplicate tensor name");
        }
    });

    nlohmann::json header;
    header["__metadata__"] = {{"format", "pt"}, {"writer", "spectron"}};
    std::size_t offset = 0;
    for (const auto& [name, tensor] : sorted) {
        header[name] = {
            {"dtype", dtype_to_str(tensor.DType)},
            {"shape", std::vector<long>(tensor.Sizes.begin(), tensor.Sizes.begin() + tensor.Rank)},
            {"data_offsets", {offset, offset + tensor.bytes()}},
        };
        offset += tensor.bytes();
    }
    std::string text = header.dump();
    text.resize((text.size() + 7) / 8 * 8, ' ');
    const std::uint64_t header_size = text.size();

    const std::string temp_name = file_name + ".tmp";
    try {
        FileHandle file(temp_name, O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP);
        file.write_all(reinterpret_cast<const std::byte*>(&header_size), sizeof(header_size));
        file.write_all(reinterpret_cast<const std::byte*>(text.data()), text.size());

        std::vector<std::byte> host;
        for (const auto& [name, tensor] : sorted) {
            if (tensor.Device < 0) {
                file.write_all(tensor.Data, tensor.bytes());
                continue;
            }
            host.resize(tensor.bytes());
            CUDA_CHECK(cudaMemcpy(host.data(), tensor.Data, tensor.bytes(), cudaMemcpyDeviceToHost));
            file.write_all(host.data(), host.size());
        }
        file.close();
        std::filesystem::rename(temp_name, file_name);
    } catch (const std::exception&) {
        std::error_code ignored;
        std::filesystem::remove(temp_name, ignored);
        throw;
    }
}

} // namespace

// ----------------------------------------------------------------------------
// Reading

SafeTensorEntry::SafeTensorEntry(std::string name, std::vector<long> shape, ETensorDType dtype,
                                 const SafeTensorsReader* reader, std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(std::move(name)), mShape(std::move(shape)), mDType(dtype), mReader(reader),
      mDataBegin(data_begin), mDataEnd(data_end) {
}

void SafeTensorEntry::read_tensor(Tensor& target) const {
    const bool same_shape = target.Rank == static_cast<int>(mShape.size()) &&
                            std::equal(mShape.begin(), mShape.end(), target.Sizes.begin());
    if (!same_shape) {
        throw std::runtime_error(fmt::format("Shape mismatch for `{}` in '{}': file has ({}), tensor is {}",
                                             mName, mReader->file_name(), fmt::join(mShape, ", "), target.shape_str()));
    }
    if (target.DType != mDType) {
        throw std::runtime_error(fmt::format("DType mismatch for `{}` in '{}': file has {}, tensor is {}",
                                             mName, mReader->file_name(), dtype_to_str(mDType), dtype_to_str(target.DType)));
    }
    if (static_cast<std::size_t>(mDataEnd - mDataBegin) != target.bytes()) {
        throw std::runtime_error(fmt::format("`{}` in '{}' stores {} bytes, expected {}",
                                             mName, mReader->file_name(), mDataEnd - mDataBegin, target.bytes()));
    }
    mReader->read_bytes(target.Data, target.Device, mDataBegin, mDataEnd);
}

SafeTensorsReader::SafeTensorsReader(std::string file_name) : mFileName(std::move(file_name)) {
    FileHandle file(mFileName, O_RDONLY);
    const auto file_size = static_cast<std::ptrdiff_t>(std::filesystem::file_size(mFileName));

    std::uint64_t header_size = 0;
    if (file_size < static_cast<std::ptrdiff_t>(sizeof(header_size))) {
        throw std::runtime_error(fmt::format("'{}' is too small to be a safetensors file", mFileName));
    }
    file.read_at(reinterpret_cast<std::byte*>(&header_size), sizeof(header_size), 0);
    if (header_size > static_cast<std::uint64_t>(file_size) - sizeof(header_size)) {
        throw std::runtime_error(fmt::format("Invalid header size {} in safetensors file '{}'", header_size, mFileName));
    }

    std::string text(header_size, '\0');
    file.read_at(reinterpret_cast<std::byte*>(text.data()), text.size(), sizeof(header_size));
    const auto header = nlohmann::json::parse(text);

    // offsets in the header are relative to the end of the header
    const std::ptrdiff_t data_start = static_cast<std::ptrdiff_t>(sizeof(header_size) + header_size);
    for (const auto& [name, info] : header.items()) {
        if (name == "__metadata__") {
            continue;
        }
        const auto begin = info.at("data_offsets").at(0).get<std::ptrdiff_t>();
        const auto end = info.at("data_offsets").at(1).get<std::ptrdiff_t>();
        if (begin < 0 || end < begin || data_start + end > file_size) {
            throw std::runtime_error(fmt::format("Invalid data offsets [{}, {}) for `{}` in '{}'", begin, end, name, mFileName));
        }
        mEntries.emplace_back(name, info.at("shape").get<std::vector<long>>(),
                              dtype_from_str(info.at("dtype").get<std::string>()),
                              this, data_start + begin, data_start + end);
    }
}

SafeTensorsReader::~SafeTensorsReader() {
    if (mStaging) {
        const cudaError_t status = cudaFreeHost(mStaging);
        if (status != cudaSuccess) {
            fmt::print(stderr, "WARNING: freeing the staging buffer of '{}' failed: {}\n", mFileName, cudaGetErrorString(status));
            (void)cudaGetLastError();
        }
    }
}

//! Host targets (device < 0) are read directly; device targets go through the pinned staging buffer.
void SafeTensorsReader::read_bytes(std::byte* target, int device, std::ptrdiff_t begin, std::ptrdiff_t end) const {
    FileHandle file(mFileName, O_RDONLY);
    const auto total = static_cast<std::size_t>(end - begin);
    if (device < 0) {
        file.read_at(target, total, begin);
        return;
    }

    const std::size_t chunk = std::min(total, kMaxStagingBytes);
    if (mStagingSize < chunk) {
        if (mStaging) {
            CUDA_CHECK(cudaFreeHost(mStaging));
            mStaging = nullptr;
            mStagingSize = 0;
        }
        CUDA_CHECK(cudaMallocHost(&mStaging, chunk));
        mStagingSize = chunk;
    }
    for (std::size_t done = 0; done < total; done += chunk) {
        const std::size_t n = std::min(chunk, total - done);
        file.read_at(mStaging, n, begin + static_cast<std::ptrdiff_t>(done));
        CUDA_CHECK(cudaMemcpy(target + done, mStaging, n, cudaMemcpyHostToDevice));
    }
}

void SafeTensorsReader::load_tensors(ITensorContainer& container) const {
    std::unordered_map<std::string_view, const SafeTensorEntry*> by_name;
    for (const auto& entry : mEntries) {
        by_name.emplace(entry.name(), &entry);
    }
    container.iterate_tensors([&](std::string name, const Tensor& tensor) {
        auto found = by_name.find(name);
        if (found == by_name.end()) {
            throw std::runtime_error(fmt::format("Tensor `{}` is missing from '{}'", name, mFileName));
        }
        Tensor target = tensor;
        found->second->read_tensor(target);
    });
}

void load_safetensors(const std::string& file_name, ITensorContainer& tensors) {
    try {
        SafeTensorsReader reader(file_name);
        reader.load_tensors(tensors);
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("Error loading safetensors file '{}': {}", file_name, e.what()));
    }
}

// ----------------------------------------------------------------------------
// Writing

void write_safetensors(const std::string& file_name, ITensorContainer& tensors) {
    write_file(file_name, tensors);
}

void write_safetensors(const std::string& file_name, ITensorContainer& tensors, NCCLCommunicator& comm) {
    comm.barrier();
    if (comm.rank() == 0) {
        write_file(file_name, tensors);
    }
    comm.barrier();
}
