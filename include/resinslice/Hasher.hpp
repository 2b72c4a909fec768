#pragma once
#include <cstddef>
#include <string>

namespace resinslice {

    class Hasher {
    public:
        // Lowercase hex SHA-256 of a file's contents.
        static std::string sha256_file(const std::string& path);

        static std::string sha256(const void* data, std::size_t size);
        static std::string sha256(const std::string& data);
    };

} // namespace resinslice
