#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>
#include "resinslice/Errors.hpp"

namespace resinslice {

    // Fixed-capacity output buffer shared by many writers. Each append claims a slot
    // from an atomic counter; claims past the capacity are counted but not stored, so
    // after the writers finish the caller can tell how much room would have been needed.
    template <typename T>
    class BoundedAppendBuffer {
    public:
        explicit BoundedAppendBuffer(std::size_t capacity) : slots_(capacity), counter_(0) {}

        BoundedAppendBuffer(const BoundedAppendBuffer&) = delete;
        BoundedAppendBuffer& operator=(const BoundedAppendBuffer&) = delete;

        // Thread-safe. Returns false when the slot lies beyond the capacity.
        bool append(const T& value) {
            const std::size_t slot = counter_.fetch_add(1, std::memory_order_relaxed);
            if (slot >= slots_.size()) {
                return false;
            }
            slots_[slot] = value;
            return true;
        }

        std::size_t capacity() const { return slots_.size(); }
        std::size_t attempted() const { return counter_.load(); }
        std::size_t size() const { return std::min(attempted(), capacity()); }
        bool overflowed() const { return attempted() > capacity(); }

        // Throws ResourceExhaustion when more appends were attempted than fit.
        void checkCapacity(const std::string& what) const {
            if (overflowed()) {
                throw ResourceExhaustion(what, attempted(), capacity());
            }
        }

        // Stored elements in slot order. Only meaningful once all writers are done.
        std::vector<T> take() {
            std::vector<T> out(slots_.begin(), slots_.begin() + static_cast<std::ptrdiff_t>(size()));
            counter_ = 0;
            return out;
        }

    private:
        std::vector<T> slots_;
        std::atomic<std::size_t> counter_;
    };

} // namespace resinslice
