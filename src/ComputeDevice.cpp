#include "resinslice/ComputeDevice.hpp"
#include "resinslice/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace resinslice {

    std::size_t resolveWorkerCount(std::size_t requested) {
        if (requested > 0) {
            return requested;
        }
        const unsigned hardware = std::thread::hardware_concurrency();
        return hardware > 0 ? hardware : 1;
    }

    void parallelFor(std::size_t count, std::size_t workers, std::size_t chunk, const Kernel& body) {
        if (count == 0) {
            return;
        }
        chunk = std::max<std::size_t>(chunk, 1);
        workers = std::min(resolveWorkerCount(workers), (count + chunk - 1) / chunk);

        std::atomic<std::size_t> cursor{0};
        std::atomic<bool> failed{false};
        std::exception_ptr firstError;
        std::mutex errorMutex;

        auto run = [&]() {
            while (!failed.load(std::memory_order_relaxed)) {
                const std::size_t begin = cursor.fetch_add(chunk);
                if (begin >= count) {
                    break;
                }
                const std::size_t end = std::min(begin + chunk, count);
                try {
                    for (std::size_t i = begin; i < end; ++i) {
                        body(i);
                    }
                } catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                    failed = true;
                }
            }
        };

        if (workers <= 1) {
            run();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(workers);
            for (std::size_t i = 0; i < workers; ++i) {
                threads.emplace_back(run);
            }
            for (auto& thread : threads) {
                thread.join();
            }
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }

    ThreadPoolDevice::ThreadPoolDevice(std::size_t workers) : workers_(resolveWorkerCount(workers)) {
        Logger::debug("Thread pool device with " + std::to_string(workers_) + " workers");
    }

    void ThreadPoolDevice::dispatch(std::size_t workItems, const Kernel& kernel) {
        parallelFor(workItems, workers_, kGroupSize, kernel);
    }

} // namespace resinslice
