#pragma once
#include <cmath>
#include <limits>
#include <vector>

namespace resinslice {

    struct Vec3 {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        Vec3() = default;
        Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

        Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
        Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
        Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
        Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }
        Vec3& operator+=(const Vec3& o) {
            x += o.x;
            y += o.y;
            z += o.z;
            return *this;
        }

        double dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }

        Vec3 cross(const Vec3& o) const {
            return {y * o.z - z * o.y,
                    z * o.x - x * o.z,
                    x * o.y - y * o.x};
        }

        double length() const { return std::sqrt(dot(*this)); }
    };

    // Row-major 3x3 matrix, only what rigid body transforms need.
    struct Matrix3 {
        double m[3][3] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};

        static Matrix3 identity() { return Matrix3(); }
        static Matrix3 rotationX(double degrees);
        static Matrix3 rotationY(double degrees);
        static Matrix3 rotationZ(double degrees);

        Matrix3 operator*(const Matrix3& o) const;
        Vec3 operator*(const Vec3& v) const;
    };

    struct BoundingBox {
        Vec3 min{std::numeric_limits<double>::infinity(),
                 std::numeric_limits<double>::infinity(),
                 std::numeric_limits<double>::infinity()};
        Vec3 max{-std::numeric_limits<double>::infinity(),
                 -std::numeric_limits<double>::infinity(),
                 -std::numeric_limits<double>::infinity()};

        void extend(const Vec3& p);

        // True until at least one point was added, or when min > max on any axis.
        bool isInverted() const;

        double width() const { return max.x - min.x; }
        double depth() const { return max.y - min.y; }
        double height() const { return max.z - min.z; }
    };

    // One triangle's intersection with one horizontal plane.
    struct Segment {
        Vec3 a;
        Vec3 b;
    };

    // Implicitly closed: the last point connects back to the first.
    using PolygonLoop = std::vector<Vec3>;

    // Unsigned planar (XY) area of a loop, shoelace formula.
    double loopArea(const PolygonLoop& loop);

} // namespace resinslice
