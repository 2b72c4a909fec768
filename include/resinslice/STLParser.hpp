#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace resinslice {

    struct Triangle {
        float normal[3];
        float vertex1[3];
        float vertex2[3];
        float vertex3[3];
        uint16_t attributeByteCount;

        Triangle() : attributeByteCount(0) {
            std::memset(normal, 0, sizeof(normal));
            std::memset(vertex1, 0, sizeof(vertex1));
            std::memset(vertex2, 0, sizeof(vertex2));
            std::memset(vertex3, 0, sizeof(vertex3));
        }

        const float* vertex(int i) const {
            return i == 0 ? vertex1 : (i == 1 ? vertex2 : vertex3);
        }

        float* vertex(int i) {
            return i == 0 ? vertex1 : (i == 1 ? vertex2 : vertex3);
        }
    };

#pragma pack(push, 1)
    struct STLTriangleRaw {
        float normal[3];
        float vertex1[3];
        float vertex2[3];
        float vertex3[3];
        uint16_t attributeByteCount;
    } __attribute__((packed));
#pragma pack(pop)

    static_assert(sizeof(STLTriangleRaw) == 50, "STLTriangleRaw must be exactly 50 bytes");

    class STLParser {
    public:
        // Reads a binary or ASCII STL file. Throws std::runtime_error on I/O failure
        // or a truncated/malformed file.
        static std::vector<Triangle> parse(const std::string& path);

        // Same as parse() for a file already in memory.
        static std::vector<Triangle> parseBuffer(const void* data, std::size_t size);

        static bool looksLikeAscii(const void* data, std::size_t size);
    };

} // namespace resinslice
