#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace resinslice {

    using Kernel = std::function<void(std::size_t workItem)>;

    // Runs body(i) for every i in [0, count) on up to `workers` threads. Items are
    // claimed from a shared atomic cursor in blocks of `chunk`. Blocks until every
    // item ran; the first exception thrown by body stops the remaining claims and is
    // rethrown on the calling thread.
    void parallelFor(std::size_t count, std::size_t workers, std::size_t chunk, const Kernel& body);

    // Handle to something able to run one kernel over a large index range. Passed
    // explicitly to the strategies that offload work; there is no global device.
    class ComputeDevice {
    public:
        virtual ~ComputeDevice() = default;

        // Blocking. Exceptions thrown by the kernel propagate to the caller.
        virtual void dispatch(std::size_t workItems, const Kernel& kernel) = 0;

        virtual std::size_t workerCount() const = 0;
        virtual std::string name() const = 0;
    };

    // Host implementation: a fixed number of worker threads per dispatch, work items
    // handed out in groups of kGroupSize.
    class ThreadPoolDevice : public ComputeDevice {
    public:
        static constexpr std::size_t kGroupSize = 64;

        // workers == 0 picks std::thread::hardware_concurrency().
        explicit ThreadPoolDevice(std::size_t workers = 0);

        void dispatch(std::size_t workItems, const Kernel& kernel) override;

        std::size_t workerCount() const override { return workers_; }
        std::string name() const override { return "thread-pool"; }

    private:
        std::size_t workers_;
    };

    // Resolves a configured worker count; 0 means one per hardware thread, at least one.
    std::size_t resolveWorkerCount(std::size_t requested);

} // namespace resinslice
