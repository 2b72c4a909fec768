#include "resinslice/Body.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace resinslice {

    namespace {
        void toFloats(const Vec3& v, float* out) {
            out[0] = static_cast<float>(v.x);
            out[1] = static_cast<float>(v.y);
            out[2] = static_cast<float>(v.z);
        }

        void rotateNormal(const Matrix3& rotation, float* normal) {
            Vec3 n = rotation * Vec3(normal[0], normal[1], normal[2]);
            double len = n.length();
            if (len > 0.0) {
                n = n / len;
            }
            toFloats(n, normal);
        }
    }

    bool Transform::isIdentity() const {
        return position.x == 0.0 && position.y == 0.0 && position.z == 0.0 &&
               rotation.x == 0.0 && rotation.y == 0.0 && rotation.z == 0.0 &&
               scale.x == 1.0 && scale.y == 1.0 && scale.z == 1.0;
    }

    bool Transform::isMirroring() const {
        return scale.x * scale.y * scale.z < 0.0;
    }

    Matrix3 Transform::rotationMatrix() const {
        return Matrix3::rotationZ(rotation.z) * Matrix3::rotationY(rotation.y) * Matrix3::rotationX(rotation.x);
    }

    Vec3 Transform::apply(const Vec3& p) const {
        return apply(p, rotationMatrix());
    }

    Vec3 Transform::apply(const Vec3& p, const Matrix3& rotation) const {
        Vec3 scaled(p.x * scale.x, p.y * scale.y, p.z * scale.z);
        return rotation * scaled + position;
    }

    Body::Body(std::string name, Mesh mesh)
            : name_(std::move(name)), mesh_(std::move(mesh)) {}

    std::vector<Triangle> Body::worldTriangles() const {
        std::vector<Triangle> triangles = mesh_.toTriangles();
        if (transform_.isIdentity()) {
            return triangles;
        }

        const Matrix3 rotation = transform_.rotationMatrix();
        const bool mirrored = transform_.isMirroring();
        for (auto& tri : triangles) {
            for (int v = 0; v < 3; ++v) {
                float* p = tri.vertex(v);
                toFloats(transform_.apply(Vec3(p[0], p[1], p[2]), rotation), p);
            }
            if (mirrored) {
                std::swap_ranges(tri.vertex2, tri.vertex2 + 3, tri.vertex3);
            }
            rotateNormal(rotation, tri.normal);
        }
        return triangles;
    }

    Mesh Body::worldMesh() const {
        Mesh world = mesh_;
        if (transform_.isIdentity()) {
            return world;
        }

        const Matrix3 rotation = transform_.rotationMatrix();
        for (auto& vertex : world.vertices) {
            toFloats(transform_.apply(vertex.point(), rotation), vertex.position);
            rotateNormal(rotation, vertex.normal);
        }
        if (transform_.isMirroring()) {
            for (size_t i = 0; i + 2 < world.indices.size(); i += 3) {
                std::swap(world.indices[i + 1], world.indices[i + 2]);
            }
        }
        return world;
    }

} // namespace resinslice
