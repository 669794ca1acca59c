// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_UTILITIES_COMM_H
#define SPECTRON_SRC_UTILITIES_COMM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

#include "tensor.h"

typedef struct ncclComm* ncclComm_t;
typedef struct CUevent_st* cudaEvent_t;
typedef struct CUstream_st* cudaStream_t;

/**
 * @brief Handle to an all-gather that has been enqueued but not yet consumed.
 *
 * Owns the completion event of the collective. wait() makes a consumer stream wait for the
 * gather, checks the provider for asynchronous failures, and returns the gathered buffer.
 * The buffer must not be read (or overwritten) before wait() has been called.
 */
class PendingGather {
public:
    using ErrorCheck = std::function<void()>;

    PendingGather() = default;
    PendingGather(Tensor gathered, cudaEvent_t done, ErrorCheck check);
    ~PendingGather() noexcept;

    PendingGather(PendingGather&& other) noexcept;
    PendingGather& operator=(PendingGather&& other) noexcept;
    PendingGather(const PendingGather&) = delete;
    PendingGather& operator=(const PendingGather&) = delete;

    /**
     * @brief Order @p consumer after the gather and return the gathered buffer.
     *
     * @throws optimizers::CommunicationError If the provider reports a failed collective.
     * @throws std::logic_error If the handle is empty or has already been waited on.
     */
    Tensor& wait(cudaStream_t consumer);

    [[nodiscard]] bool valid() const { return mDone != nullptr && !mWaited; }

private:
    void release() noexcept;

    Tensor mGathered{};
    cudaEvent_t mDone = nullptr;
    ErrorCheck mCheck;
    bool mWaited = false;
};

/**
 * @brief Minimal collective-communication interface consumed by the optimizer core.
 */
class ICollective {
public:
    virtual ~ICollective() = default;

    [[nodiscard]] virtual int rank() const = 0;
    [[nodiscard]] virtual int world_size() const = 0;

    /**
     * @brief Start an asynchronous all-gather of @p local into @p gathered.
     *
     * Returns immediately. Slot r of @p gathered (elements [r*n, (r+1)*n) with n = local.nelem())
     * receives rank r's contribution. Work already enqueued on @p producer is complete before
     * @p local is read.
     *
     * @throws std::logic_error If @p gathered is not world_size() times the size of @p local, or dtypes differ.
     */
    [[nodiscard]] virtual PendingGather all_gather(const Tensor& local, Tensor& gathered, cudaStream_t producer) = 0;
};

class NCCLCommunicator : public ICollective {
public:
    NCCLCommunicator(int rank, int world, const void* nccl_id);
    ~NCCLCommunicator() override;

    // Cpu-side barrier across all ranks
    virtual void barrier() = 0;

    /**
     * @name Transactions
     * Collectives scheduled between begin_transaction() and execute_transaction() are issued
     * together on the comms stream, after @p ready (or the work enqueued on the given stream),
     * and @p signal is recorded once all of them have completed.
     */
    ///@{
    void begin_transaction(cudaEvent_t ready);
    void begin_transaction(cudaStream_t wait_for_stream);
    void schedule_all_gather(const Tensor& src, Tensor& tgt);
    void schedule_all_reduce_avg(Tensor& tensor);
    void execute_transaction(cudaEvent_t signal);
    ///@}

    [[nodiscard]] PendingGather all_gather(const Tensor& local, Tensor& gathered, cudaStream_t producer) override;

    //! Mean of a single device scalar over all ranks, in place.
    void reduce_loss(float* loss, cudaStream_t stream);
    //! Element-wise sum of @p n device integers over all ranks, in place.
    void all_reduce_sum_int(int* values, int n, cudaStream_t stream);

    //! Throws optimizers::CommunicationError if NCCL reports an asynchronous failure.
    void check_async_error() const;

    [[nodiscard]] int rank() const override { return mRank; }
    [[nodiscard]] int world_size() const override { return mWorld; }

    [[nodiscard]] cudaStream_t stream() const { return mCommsStream; }

    //! On the root rank, returns a vector of (memcpyable) T objects that
    //! have been gathered from all ranks.
    template<typename T>
    std::vector<T> host_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result;
        if(rank() == 0) {
            result.resize(world_size());
        }

        gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    /**
     * @brief Run distributed training with one thread per local GPU (blocking).
     *
     * Launches one worker thread per GPU, each with its own communicator; the threads
     * synchronize through a std::barrier. An exception on any worker is rethrown here
     * after all workers have stopped.
     *
     * @param ngpus Number of local GPUs to use (0 = auto-detect all available).
     * @param memcpy_allgather Enable memcpy-based all-gather emulation.
     * @param work Callable invoked once per GPU with that GPU's communicator.
     */
    static void run_communicators(int ngpus, bool memcpy_allgather, std::function<void(NCCLCommunicator& comm)> work);

    //! Fresh NCCL unique id, as raw bytes.
    static std::array<std::byte, 128> generate_nccl_id();

protected:
    void terminate_nccl(bool unwinding);

    void enqueue_all_reduce_avg(std::byte* data, std::size_t elements, ETensorDType dtype);

    //! Gathers world_size() equal shards of @p src into @p tgt; @p size is the size of @p tgt in bytes.
    virtual void enqueue_all_gather(const std::byte* src, std::byte* tgt, std::size_t size);

    virtual void gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;
    virtual void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;

    struct CommandBuffer;
    virtual void on_execute_transaction(const CommandBuffer&) = 0;
    virtual void on_finish_transaction(cudaEvent_t signal) = 0;
private:
    ncclComm_t mNcclComm;
    int mRank;
    int mWorld;

    cudaEvent_t mCommsSync;
    cudaStream_t mCommsStream;

    std::unique_ptr<CommandBuffer> mCmdBuf;
};

#endif //SPECTRON_SRC_UTILITIES_COMM_H
