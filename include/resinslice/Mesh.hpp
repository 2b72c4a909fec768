#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "resinslice/Geometry.hpp"
#include "resinslice/STLParser.hpp"

namespace resinslice {

    struct Vertex {
        float position[3] = {0.0f, 0.0f, 0.0f};
        float normal[3] = {0.0f, 0.0f, 0.0f};

        Vertex() = default;
        Vertex(const float* p, const float* n);

        Vec3 point() const { return {position[0], position[1], position[2]}; }

        // Bitwise comparison of position and normal, so -0.0f and 0.0f differ and
        // NaN payloads compare equal to themselves.
        bool operator==(const Vertex& other) const;
        bool operator!=(const Vertex& other) const { return !(*this == other); }
    };

    struct VertexHash {
        std::size_t operator()(const Vertex& v) const;
    };

    struct Mesh {
        std::vector<Vertex> vertices;
        std::vector<uint32_t> indices;

        // Validates index count and range. Throws InputContractViolation.
        static Mesh fromIndexed(std::vector<Vertex> vertices, std::vector<uint32_t> indices);

        std::size_t triangleCount() const { return indices.size() / 3; }

        // Rebuilds one triangle for slicing. Its normal is the normalized sum of the
        // three vertex normals, +Z when that sum vanishes.
        Triangle triangle(std::size_t i) const;
        std::vector<Triangle> toTriangles() const;

        BoundingBox boundingBox() const;

        // Signed volume enclosed by the referenced triangles (model units cubed).
        double volume() const;
    };

    class MeshBuilder {
    public:
        // Full import pipeline: weld bit-identical vertices, synthesize normals,
        // drop degenerate triangles.
        static Mesh build(const std::vector<Triangle>& triangles);

        static Mesh weld(const std::vector<Triangle>& triangles);

        // Un-weighted smooth normals: sum of unit face normals per vertex, normalized.
        static void computeVertexNormals(Mesh& mesh);

        // Returns the number of triangles removed. Vertices are left untouched.
        static std::size_t removeDegenerateTriangles(Mesh& mesh);
    };

} // namespace resinslice
