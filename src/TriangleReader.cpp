#include "resinslice/TriangleReader.hpp"
#include "resinslice/Hasher.hpp"
#include <stdexcept>
#include <utility>

namespace resinslice {

    std::vector<Triangle> StlTriangleReader::readTriangles(const std::string& source) const {
        return STLParser::parse(source);
    }

    std::string StlTriangleReader::fingerprint(const std::string& source) const {
        return Hasher::sha256_file(source);
    }

    void InMemoryTriangleReader::add(const std::string& source, std::vector<Triangle> triangles) {
        sources[source] = std::move(triangles);
    }

    std::vector<Triangle> InMemoryTriangleReader::readTriangles(const std::string& source) const {
        auto it = sources.find(source);
        if (it == sources.end()) {
            throw std::runtime_error("Unknown triangle source: " + source);
        }
        return it->second;
    }

    std::string InMemoryTriangleReader::fingerprint(const std::string& source) const {
        std::vector<float> coordinates;
        for (const auto& triangle : readTriangles(source)) {
            for (int i = 0; i < 3; ++i) {
                const float* v = triangle.vertex(i);
                coordinates.insert(coordinates.end(), v, v + 3);
            }
        }
        return Hasher::sha256(coordinates.data(), coordinates.size() * sizeof(float));
    }

} // namespace resinslice
