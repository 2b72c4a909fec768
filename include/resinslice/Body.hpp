#pragma once
#include <string>
#include <vector>
#include "resinslice/Geometry.hpp"
#include "resinslice/Mesh.hpp"

namespace resinslice {

    // Whole-body rigid placement. Applied as scale, then rotation about X, Y and Z
    // (degrees, in that order), then translation.
    struct Transform {
        Vec3 position{0.0, 0.0, 0.0};
        Vec3 rotation{0.0, 0.0, 0.0};
        Vec3 scale{1.0, 1.0, 1.0};

        bool isIdentity() const;
        // An odd number of negative scale factors turns the triangle winding inside out.
        bool isMirroring() const;
        Matrix3 rotationMatrix() const;
        Vec3 apply(const Vec3& p) const;
        Vec3 apply(const Vec3& p, const Matrix3& rotation) const;
    };

    // A mesh placed on the build plate. The mesh itself never changes after import;
    // moving the body only changes its transform.
    class Body {
    public:
        Body() = default;
        Body(std::string name, Mesh mesh);

        const std::string& name() const { return name_; }
        const Mesh& mesh() const { return mesh_; }

        const Transform& transform() const { return transform_; }
        void setTransform(const Transform& transform) { transform_ = transform; }
        void setPosition(const Vec3& position) { transform_.position = position; }
        void setRotation(const Vec3& degrees) { transform_.rotation = degrees; }
        void setScale(const Vec3& scale) { transform_.scale = scale; }

        bool enabled() const { return enabled_; }
        void setEnabled(bool enabled) { enabled_ = enabled; }

        // Mesh triangles in build-plate coordinates.
        std::vector<Triangle> worldTriangles() const;

        // Copy of the mesh with vertex positions in build-plate coordinates; indices are
        // shared verbatim, so island classifications map back to mesh vertices.
        Mesh worldMesh() const;

    private:
        std::string name_;
        Mesh mesh_;
        Transform transform_;
        bool enabled_ = true;
    };

} // namespace resinslice
