#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace resinslice {

    class SliceError : public std::runtime_error {
    public:
        explicit SliceError(const std::string& message) : std::runtime_error(message) {}
    };

    // The caller handed in input that breaks a documented precondition
    // (bad index count, empty triangle set, non-positive thickness, ...).
    // Never retried by the library.
    class InputContractViolation : public SliceError {
    public:
        explicit InputContractViolation(const std::string& message)
                : SliceError("Input contract violation: " + message) {}
    };

    // The offload strategy ran out of segment buffer capacity.
    class ResourceExhaustion : public SliceError {
    public:
        ResourceExhaustion(const std::string& what, std::size_t attempted, std::size_t available)
                : SliceError("Resource exhausted: " + what + " (attempted " + std::to_string(attempted) +
                             ", available " + std::to_string(available) + ")"),
                  attempted_(attempted),
                  available_(available) {}

        std::size_t attempted() const { return attempted_; }
        std::size_t available() const { return available_; }

    private:
        std::size_t attempted_;
        std::size_t available_;
    };

} // namespace resinslice
