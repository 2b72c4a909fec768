#include "resinslice/Mesh.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Tolerances.hpp"
#include <cmath>
#include <cstring>
#include <functional>
#include <unordered_map>
#include <utility>

namespace resinslice {

    namespace {

        void subtract(const float* a, const float* b, float* out) {
            out[0] = a[0] - b[0];
            out[1] = a[1] - b[1];
            out[2] = a[2] - b[2];
        }

        void cross(const float* a, const float* b, float* out) {
            out[0] = a[1] * b[2] - a[2] * b[1];
            out[1] = a[2] * b[0] - a[0] * b[2];
            out[2] = a[0] * b[1] - a[1] * b[0];
        }

        float length(const float* v) {
            return std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]);
        }

        void edgeCross(const float* v0, const float* v1, const float* v2, float* out) {
            float e1[3];
            float e2[3];
            subtract(v1, v0, e1);
            subtract(v2, v0, e2);
            cross(e1, e2, out);
        }

        uint32_t bits(float f) {
            uint32_t b;
            std::memcpy(&b, &f, sizeof(b));
            return b;
        }

        void hashCombine(std::size_t& seed, uint32_t value) {
            seed ^= std::hash<uint32_t>()(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
    }

    Vertex::Vertex(const float* p, const float* n) {
        std::memcpy(position, p, sizeof(position));
        std::memcpy(normal, n, sizeof(normal));
    }

    bool Vertex::operator==(const Vertex& other) const {
        return std::memcmp(position, other.position, sizeof(position)) == 0 &&
               std::memcmp(normal, other.normal, sizeof(normal)) == 0;
    }

    std::size_t VertexHash::operator()(const Vertex& v) const {
        std::size_t seed = 0;
        for (int i = 0; i < 3; ++i) {
            hashCombine(seed, bits(v.position[i]));
        }
        for (int i = 0; i < 3; ++i) {
            hashCombine(seed, bits(v.normal[i]));
        }
        return seed;
    }

    Mesh Mesh::fromIndexed(std::vector<Vertex> vertices, std::vector<uint32_t> indices) {
        if (indices.size() % 3 != 0) {
            throw InputContractViolation("index count " + std::to_string(indices.size()) +
                                         " is not a multiple of 3");
        }
        for (size_t i = 0; i < indices.size(); ++i) {
            if (indices[i] >= vertices.size()) {
                throw InputContractViolation("index " + std::to_string(indices[i]) + " at position " +
                                             std::to_string(i) + " exceeds vertex count " +
                                             std::to_string(vertices.size()));
            }
        }

        Mesh mesh;
        mesh.vertices = std::move(vertices);
        mesh.indices = std::move(indices);
        return mesh;
    }

    Triangle Mesh::triangle(std::size_t i) const {
        const Vertex& v0 = vertices[indices[i * 3]];
        const Vertex& v1 = vertices[indices[i * 3 + 1]];
        const Vertex& v2 = vertices[indices[i * 3 + 2]];

        Triangle tri;
        std::memcpy(tri.vertex1, v0.position, sizeof(tri.vertex1));
        std::memcpy(tri.vertex2, v1.position, sizeof(tri.vertex2));
        std::memcpy(tri.vertex3, v2.position, sizeof(tri.vertex3));

        float sum[3] = {
                v0.normal[0] + v1.normal[0] + v2.normal[0],
                v0.normal[1] + v1.normal[1] + v2.normal[1],
                v0.normal[2] + v1.normal[2] + v2.normal[2]
        };
        float len = length(sum);
        if (len != 0.0f) {
            tri.normal[0] = sum[0] / len;
            tri.normal[1] = sum[1] / len;
            tri.normal[2] = sum[2] / len;
        } else {
            tri.normal[2] = 1.0f;
        }
        return tri;
    }

    std::vector<Triangle> Mesh::toTriangles() const {
        std::vector<Triangle> triangles;
        triangles.reserve(triangleCount());
        for (size_t i = 0; i < triangleCount(); ++i) {
            triangles.push_back(triangle(i));
        }
        return triangles;
    }

    BoundingBox Mesh::boundingBox() const {
        BoundingBox box;
        for (uint32_t index : indices) {
            box.extend(vertices[index].point());
        }
        return box;
    }

    double Mesh::volume() const {
        double total = 0.0;
        for (size_t i = 0; i < triangleCount(); ++i) {
            const Vec3 a = vertices[indices[i * 3]].point();
            const Vec3 b = vertices[indices[i * 3 + 1]].point();
            const Vec3 c = vertices[indices[i * 3 + 2]].point();
            total += a.cross(b).dot(c) / 6.0;
        }
        return total;
    }

    Mesh MeshBuilder::weld(const std::vector<Triangle>& triangles) {
        Mesh mesh;
        mesh.indices.reserve(triangles.size() * 3);

        std::unordered_map<Vertex, uint32_t, VertexHash> vertexMap;
        vertexMap.reserve(triangles.size() * 3);

        const float zero[3] = {0.0f, 0.0f, 0.0f};
        for (const auto& tri : triangles) {
            for (int v = 0; v < 3; ++v) {
                Vertex candidate(tri.vertex(v), zero);

                auto it = vertexMap.find(candidate);
                if (it != vertexMap.end()) {
                    mesh.indices.push_back(it->second);
                    continue;
                }

                auto index = static_cast<uint32_t>(mesh.vertices.size());
                mesh.vertices.push_back(candidate);
                vertexMap.emplace(candidate, index);
                mesh.indices.push_back(index);
            }
        }
        return mesh;
    }

    void MeshBuilder::computeVertexNormals(Mesh& mesh) {
        for (auto& vertex : mesh.vertices) {
            vertex.normal[0] = 0.0f;
            vertex.normal[1] = 0.0f;
            vertex.normal[2] = 0.0f;
        }

        for (size_t t = 0; t < mesh.triangleCount(); ++t) {
            const uint32_t* tri = &mesh.indices[t * 3];

            float faceNormal[3];
            edgeCross(mesh.vertices[tri[0]].position,
                      mesh.vertices[tri[1]].position,
                      mesh.vertices[tri[2]].position,
                      faceNormal);

            float len = length(faceNormal);
            if (len > kNormalEpsilon) {
                faceNormal[0] /= len;
                faceNormal[1] /= len;
                faceNormal[2] /= len;
            } else {
                faceNormal[0] = 0.0f;
                faceNormal[1] = 0.0f;
                faceNormal[2] = 1.0f;
            }

            for (int k = 0; k < 3; ++k) {
                float* n = mesh.vertices[tri[k]].normal;
                n[0] += faceNormal[0];
                n[1] += faceNormal[1];
                n[2] += faceNormal[2];
            }
        }

        for (auto& vertex : mesh.vertices) {
            float len = length(vertex.normal);
            if (len > kNormalEpsilon) {
                vertex.normal[0] /= len;
                vertex.normal[1] /= len;
                vertex.normal[2] /= len;
            }
        }
    }

    std::size_t MeshBuilder::removeDegenerateTriangles(Mesh& mesh) {
        std::vector<uint32_t> kept;
        kept.reserve(mesh.indices.size());

        size_t removed = 0;
        for (size_t t = 0; t < mesh.triangleCount(); ++t) {
            const uint32_t* tri = &mesh.indices[t * 3];

            float c[3];
            edgeCross(mesh.vertices[tri[0]].position,
                      mesh.vertices[tri[1]].position,
                      mesh.vertices[tri[2]].position,
                      c);

            if (length(c) > kDegenerateArea) {
                kept.insert(kept.end(), tri, tri + 3);
            } else {
                Logger::debug("Dropping degenerate triangle " + std::to_string(t));
                ++removed;
            }
        }

        mesh.indices = std::move(kept);
        if (removed > 0) {
            Logger::warn("Removed " + std::to_string(removed) + " degenerate triangles");
        }
        return removed;
    }

    Mesh MeshBuilder::build(const std::vector<Triangle>& triangles) {
        Mesh mesh = weld(triangles);
        computeVertexNormals(mesh);
        removeDegenerateTriangles(mesh);

        Logger::info("Built mesh: " + std::to_string(mesh.vertices.size()) + " vertices, " +
                     std::to_string(mesh.triangleCount()) + " triangles from " +
                     std::to_string(triangles.size()) + " input triangles");
        return mesh;
    }

} // namespace resinslice
