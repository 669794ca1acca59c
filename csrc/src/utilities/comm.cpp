// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <algorithm>
#include <barrier>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>

#include <cuda_runtime.h>
#include <fmt/core.h>
#include <nccl.h>

#include "runtime/optimizers/errors.h"
#include "tensor.h"
#include "utils.h"

namespace {

void nccl_check(ncclResult_t status, const char* statement, const char* file, int line) {
    if (status != ncclSuccess) {
        throw optimizers::CommunicationError(
            fmt::format("NCCL error {} in {}:{} ({})", ncclGetErrorString(status), file, line, statement));
    }
}

//! Teardown paths must not throw; report and clear the sticky error instead.
void warn_on_cuda_error(cudaError_t status, const char* what) noexcept {
    if (status != cudaSuccess) {
        std::fprintf(stderr, "WARNING: %s failed: %s\n", what, cudaGetErrorString(status));
        std::fflush(stderr);
        (void)cudaGetLastError();
    }
}

ncclDataType_t to_nccl_dtype(ETensorDType dtype) {
    switch (dtype) {
        case ETensorDType::FP32: return ncclFloat;
        case ETensorDType::BF16: return ncclBfloat16;
        case ETensorDType::FP16: return ncclFloat16;
        default:
            throw std::logic_error(fmt::format("all-reduce: unsupported dtype {}", dtype_to_str(dtype)));
    }
}

template<class... Fs>
struct overloaded : Fs... { using Fs::operator()...; };

} // namespace

#define NCCL_CHECK(status) nccl_check(status, #status, __FILE__, __LINE__)

// ============================================================================
// PendingGather
// ============================================================================

PendingGather::PendingGather(Tensor gathered, cudaEvent_t done, ErrorCheck check) :
    mGathered(gathered), mDone(done), mCheck(std::move(check)) {
}

PendingGather::~PendingGather() noexcept {
    release();
}

PendingGather::PendingGather(PendingGather&& other) noexcept :
    mGathered(other.mGathered), mDone(std::exchange(other.mDone, nullptr)),
    mCheck(std::move(other.mCheck)), mWaited(other.mWaited) {
}

PendingGather& PendingGather::operator=(PendingGather&& other) noexcept {
    if (this != &other) {
        release();
        mGathered = other.mGathered;
        mDone = std::exchange(other.mDone, nullptr);
        mCheck = std::move(other.mCheck);
        mWaited = other.mWaited;
    }
    return *this;
}

void PendingGather::release() noexcept {
    if (mDone) {
        warn_on_cuda_error(cudaEventDestroy(mDone), "destroying gather completion event");
        mDone = nullptr;
    }
}

Tensor& PendingGather::wait(cudaStream_t consumer) {
    if (mDone == nullptr) {
        throw std::logic_error("PendingGather::wait: empty handle");
    }
    if (mWaited) {
        throw std::logic_error("PendingGather::wait: gather has already been awaited");
    }
    CUDA_CHECK(cudaStreamWaitEvent(consumer, mDone, 0));
    if (mCheck) {
        mCheck();
    }
    mWaited = true;
    return mGathered;
}

// ============================================================================
// NCCLCommunicator
// ============================================================================

struct NCCLCommunicator::CommandBuffer
{
    struct Gather {
        const std::byte* Src;
        std::byte* Dst;
        std::size_t Bytes;
    };

    struct AllReduce {
        ETensorDType DType;
        std::byte* Data;
        std::size_t Elements;
    };

    [[nodiscard]] bool has_gather() const {
        return std::any_of(Commands.begin(), Commands.end(), [](const auto& c) { return std::holds_alternative<Gather>(c); });
    }
    [[nodiscard]] bool has_reduce() const {
        return std::any_of(Commands.begin(), Commands.end(), [](const auto& c) { return std::holds_alternative<AllReduce>(c); });
    }

    std::vector<std::variant<Gather, AllReduce>> Commands;
    cudaEvent_t Ready = nullptr;
};

NCCLCommunicator::NCCLCommunicator(int rank, int world, const void* nccl_id) :
    mNcclComm(nullptr), mRank(rank), mWorld(world), mCmdBuf(std::make_unique<CommandBuffer>())
{
    CUDA_CHECK(cudaSetDevice(mRank));
    NCCL_CHECK(ncclCommInitRank(&mNcclComm, mWorld, *static_cast<const ncclUniqueId*>(nccl_id), mRank));

    // stream and event belong to the device selected above
    mCommsStream = create_named_stream("nccl_stream");
    mCommsSync = create_named_event("nccl_sync");
}

/**
 * @brief Tears down NCCL on a helper thread with a timeout.
 *
 * A peer that died mid-collective can make finalize block forever; in that case the
 * helper is abandoned (and leaked) so that the owning thread can still exit.
 */
NCCLCommunicator::~NCCLCommunicator() {
    // uncaught_exceptions() is per thread, so it has to be read here and not on the helper
    const bool unwinding = std::uncaught_exceptions() > 0;
    auto teardown = std::async(std::launch::async, [this, unwinding]() {
        try {
            terminate_nccl(unwinding);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "WARNING: NCCL teardown on rank %d failed: %s\n", mRank, e.what());
            std::fflush(stderr);
        }
    });

    if (teardown.wait_for(std::chrono::seconds(2)) == std::future_status::timeout) {
        std::fprintf(stderr, "WARNING: NCCL teardown on rank %d timed out, abandoning it\n", mRank);
        new auto(std::move(teardown));
    }
    warn_on_cuda_error(cudaEventDestroy(mCommsSync), "destroying nccl_sync");
    warn_on_cuda_error(cudaStreamDestroy(mCommsStream), "destroying nccl_stream");
}

//! Finalizes cleanly when nothing went wrong; aborts when the owner is unwinding or NCCL reported an error.
void NCCLCommunicator::terminate_nccl(bool unwinding) {
    ncclResult_t async_status;
    NCCL_CHECK(ncclCommGetAsyncError(mNcclComm, &async_status));
    if (unwinding || async_status != ncclSuccess) {
        NCCL_CHECK(ncclCommAbort(mNcclComm));
        return;
    }
    CUDA_CHECK(cudaStreamSynchronize(mCommsStream));
    NCCL_CHECK(ncclCommFinalize(mNcclComm));
    NCCL_CHECK(ncclCommDestroy(mNcclComm));
}

void NCCLCommunicator::check_async_error() const {
    ncclResult_t async_status;
    NCCL_CHECK(ncclCommGetAsyncError(mNcclComm, &async_status));
    if (async_status != ncclSuccess && async_status != ncclInProgress) {
        throw optimizers::CommunicationError(fmt::format(
            "NCCL asynchronous error on rank {}: {}", mRank, ncclGetErrorString(async_status)));
    }
}

void NCCLCommunicator::begin_transaction(cudaEvent_t ready) {
    if (!mCmdBuf->Commands.empty()) {
        throw std::logic_error("begin_transaction: previous transaction was not executed");
    }
    mCmdBuf->Ready = ready;
}

void NCCLCommunicator::begin_transaction(cudaStream_t wait_for_stream) {
    CUDA_CHECK(cudaEventRecord(mCommsSync, wait_for_stream));
    begin_transaction(mCommsSync);
}

void NCCLCommunicator::schedule_all_gather(const Tensor& src, Tensor& tgt) {
    if (src.Data == nullptr || tgt.Data == nullptr) {
        throw std::logic_error("all-gather: source and target must be allocated");
    }
    if (src.DType != tgt.DType) {
        throw std::logic_error(fmt::format("all-gather: dtype {} of the local shard does not match dtype {} of the target",
                                           dtype_to_str(src.DType), dtype_to_str(tgt.DType)));
    }
    if (tgt.nelem() != src.nelem() * static_cast<std::size_t>(mWorld)) {
        throw std::logic_error(fmt::format("all-gather: target {} must hold {} shards of {}", tgt.shape_str(), mWorld, src.shape_str()));
    }
    mCmdBuf->Commands.emplace_back(CommandBuffer::Gather{.Src = src.Data, .Dst = tgt.Data, .Bytes = tgt.bytes()});
}

void NCCLCommunicator::schedule_all_reduce_avg(Tensor& tensor) {
    if (tensor.Data == nullptr) {
        throw std::logic_error("all-reduce: tensor must be allocated");
    }
    (void)to_nccl_dtype(tensor.DType);
    mCmdBuf->Commands.emplace_back(CommandBuffer::AllReduce{.DType = tensor.DType, .Data = tensor.Data, .Elements = tensor.nelem()});
}

void NCCLCommunicator::execute_transaction(cudaEvent_t signal) {
    on_execute_transaction(*mCmdBuf);
    auto dispatch = overloaded{
        [this](const CommandBuffer::Gather& cmd) { enqueue_all_gather(cmd.Src, cmd.Dst, cmd.Bytes); },
        [this](const CommandBuffer::AllReduce& cmd) { enqueue_all_reduce_avg(cmd.Data, cmd.Elements, cmd.DType); },
    };
    for (const auto& cmd : mCmdBuf->Commands) {
        std::visit(dispatch, cmd);
    }
    on_finish_transaction(signal);
    mCmdBuf->Commands.clear();
}

/**
 * @brief A gather is a transaction of its own; the returned handle owns its completion event.
 *
 * Awaiting the handle also surfaces asynchronous NCCL failures as CommunicationError.
 */
PendingGather NCCLCommunicator::all_gather(const Tensor& local, Tensor& gathered, cudaStream_t producer) {
    begin_transaction(producer);
    schedule_all_gather(local, gathered);
    cudaEvent_t done = nullptr;
    try {
        done = create_named_event("gather_done");
        execute_transaction(done);
    } catch (const std::exception&) {
        mCmdBuf->Commands.clear();
        if (done) {
            warn_on_cuda_error(cudaEventDestroy(done), "destroying gather_done");
        }
        throw;
    }
    return PendingGather(gathered, done, [this]() { check_async_error(); });
}

void NCCLCommunicator::reduce_loss(float* loss, cudaStream_t stream) {
    if (mWorld > 1) {
        NCCL_CHECK(ncclAllReduce(loss, loss, 1, ncclFloat, ncclAvg, mNcclComm, stream));
    }
}

void NCCLCommunicator::all_reduce_sum_int(int* values, int n, cudaStream_t stream) {
    if (mWorld > 1) {
        NCCL_CHECK(ncclAllReduce(values, values, n, ncclInt32, ncclSum, mNcclComm, stream));
    }
}

void NCCLCommunicator::enqueue_all_reduce_avg(std::byte* data, std::size_t elements, ETensorDType dtype) {
    NCCL_CHECK(ncclAllReduce(data, data, elements, to_nccl_dtype(dtype), ncclAvg, mNcclComm, mCommsStream));
}

void NCCLCommunicator::enqueue_all_gather(const std::byte* src, std::byte* tgt, std::size_t size) {
    NCCL_CHECK(ncclAllGather(src, tgt, div_exact(size, static_cast<std::size_t>(mWorld)), ncclInt8, mNcclComm, mCommsStream));
}

// ============================================================================
// One thread per local GPU
// ============================================================================

/**
 * @brief Communicator for ranks that are threads of the same process.
 *
 * Host-side exchange goes through shared memory guarded by a std::barrier. With
 * memcpy_allgather, all-gathers are peer-to-peer device copies instead of NCCL calls;
 * all-reduces always use NCCL.
 */
class NCCLCommunicatorImpl : public NCCLCommunicator {
public:
    struct SharedState {
        explicit SharedState(int world) : Barrier(world), Slots(world), Exceptions(world) {}

        std::barrier<> Barrier;
        std::vector<const std::byte*> Slots;    // one per rank
        std::vector<std::exception_ptr> Exceptions;
        std::mutex Mutex;
    };

    NCCLCommunicatorImpl(int rank, int world, bool memcpy_allgather, const void* nccl_id, std::shared_ptr<SharedState> state)
        : NCCLCommunicator(rank, world, nccl_id), mShare(std::move(state)), mMemcpyAllGather(memcpy_allgather) {
    }

    ~NCCLCommunicatorImpl() override {
        mShare->Barrier.arrive_and_drop();
    }

    void barrier() override {
        mShare->Barrier.arrive_and_wait();
    }

protected:
    void gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;
    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;
    void enqueue_all_gather(const std::byte* src, std::byte* tgt, std::size_t size) override;
    void on_execute_transaction(const CommandBuffer& cmd) override;
    void on_finish_transaction(cudaEvent_t signal) override;

private:
    std::shared_ptr<SharedState> mShare;
    bool mMemcpyAllGather = false;

    // how the current transaction is carried out
    bool mPeerCopies = false;
    bool mNcclGroup = false;
};

void NCCLCommunicatorImpl::gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    mShare->Slots[rank()] = object;
    barrier();
    if (rank() == 0) {
        for (int r = 0; r < world_size(); ++r) {
            std::memcpy(recv + r * size, mShare->Slots[r], size);
        }
    }
    barrier();
}

void NCCLCommunicatorImpl::all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    mShare->Slots[rank()] = object;
    barrier();
    for (int r = 0; r < world_size(); ++r) {
        std::memcpy(recv + r * size, mShare->Slots[r], size);
    }
    barrier();
}

void NCCLCommunicatorImpl::enqueue_all_gather(const std::byte* src, std::byte* tgt, std::size_t size) {
    if (!mMemcpyAllGather) {
        NCCLCommunicator::enqueue_all_gather(src, tgt, size);
        return;
    }
    const std::size_t shard = div_exact(size, static_cast<std::size_t>(world_size()));
    const auto sources = host_all_gather(src);
    for (int r = 0; r < world_size(); ++r) {
        CUDA_CHECK(cudaMemcpyAsync(tgt + r * shard, sources[r], shard, cudaMemcpyDeviceToDevice, stream()));
    }
}

void NCCLCommunicatorImpl::on_execute_transaction(const CommandBuffer& cmd) {
    mPeerCopies = mMemcpyAllGather && cmd.has_gather();
    mNcclGroup = cmd.has_reduce() || (!mMemcpyAllGather && cmd.has_gather());

    if (mPeerCopies) {
        // peer copies read the sources of every rank, so wait until all of them are ready
        for (cudaEvent_t ready : host_all_gather(cmd.Ready)) {
            CUDA_CHECK(cudaStreamWaitEvent(stream(), ready, 0));
        }
    } else {
        CUDA_CHECK(cudaStreamWaitEvent(stream(), cmd.Ready, 0));
    }

    if (mNcclGroup) {
        NCCL_CHECK(ncclGroupStart());
    }
}

void NCCLCommunicatorImpl::on_finish_transaction(cudaEvent_t signal) {
    if (mNcclGroup) {
        NCCL_CHECK(ncclGroupEnd());
    }
    CUDA_CHECK(cudaEventRecord(signal, stream()));

    if (mPeerCopies) {
        // our source may only be reused once every peer has finished copying from it
        const auto peers_done = host_all_gather(signal);
        for (int r = 0; r < world_size(); ++r) {
            if (r != rank()) {
                CUDA_CHECK(cudaStreamWaitEvent(stream(), peers_done[r], 0));
            }
        }
        barrier();
        CUDA_CHECK(cudaEventRecord(signal, stream()));
    }
}

std::array<std::byte, 128> NCCLCommunicator::generate_nccl_id() {
    static_assert(sizeof(ncclUniqueId) == 128, "unexpected ncclUniqueId size");
    ncclUniqueId id;
    NCCL_CHECK(ncclGetUniqueId(&id));
    std::array<std::byte, 128> bytes;
    std::memcpy(bytes.data(), &id, bytes.size());
    return bytes;
}

void NCCLCommunicator::run_communicators(int ngpus, bool memcpy_allgather, std::function<void(NCCLCommunicator& comm)> work) {
    int gpus_available = 0;
    CUDA_CHECK(cudaGetDeviceCount(&gpus_available));
    if (ngpus == 0) {
        ngpus = gpus_available;
    }
    if (ngpus > gpus_available) {
        throw std::runtime_error(fmt::format("Requested {} GPUs, but only {} available", ngpus, gpus_available));
    }

    const auto nccl_id = generate_nccl_id();
    auto shared = std::make_shared<NCCLCommunicatorImpl::SharedState>(ngpus);

    {
        std::vector<std::jthread> workers;
        workers.reserve(ngpus);
        for (int rank = 0; rank < ngpus; ++rank) {
            workers.emplace_back([rank, ngpus, memcpy_allgather, &nccl_id, &shared, &work]() {
                try {
                    NCCLCommunicatorImpl comm(rank, ngpus, memcpy_allgather, nccl_id.data(), shared);
                    work(comm);
                    comm.barrier();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(shared->Mutex);
                    shared->Exceptions[rank] = std::current_exception();
                }
            });
        }
    } // jthreads join here

    for (std::size_t rank = 0; rank < shared->Exceptions.size(); ++rank) {
        if (auto error = shared->Exceptions[rank]) {
            std::fprintf(stderr, "Rank %zu exited with an exception\n", rank);
            std::fflush(stderr);
            std::rethrow_exception(error);
        }
    }
}
