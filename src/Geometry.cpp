#include "resinslice/Geometry.hpp"
#include <algorithm>

namespace resinslice {

    namespace {
        constexpr double kPi = 3.14159265358979323846;

        double toRadians(double degrees) {
            return degrees * kPi / 180.0;
        }
    }

    Matrix3 Matrix3::rotationX(double degrees) {
        const double c = std::cos(toRadians(degrees));
        const double s = std::sin(toRadians(degrees));
        Matrix3 r;
        r.m[1][1] = c;
        r.m[1][2] = -s;
        r.m[2][1] = s;
        r.m[2][2] = c;
        return r;
    }

    Matrix3 Matrix3::rotationY(double degrees) {
        const double c = std::cos(toRadians(degrees));
        const double s = std::sin(toRadians(degrees));
        Matrix3 r;
        r.m[0][0] = c;
        r.m[0][2] = s;
        r.m[2][0] = -s;
        r.m[2][2] = c;
        return r;
    }

    Matrix3 Matrix3::rotationZ(double degrees) {
        const double c = std::cos(toRadians(degrees));
        const double s = std::sin(toRadians(degrees));
        Matrix3 r;
        r.m[0][0] = c;
        r.m[0][1] = -s;
        r.m[1][0] = s;
        r.m[1][1] = c;
        return r;
    }

    Matrix3 Matrix3::operator*(const Matrix3& o) const {
        Matrix3 r;
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                r.m[i][j] = m[i][0] * o.m[0][j] + m[i][1] * o.m[1][j] + m[i][2] * o.m[2][j];
            }
        }
        return r;
    }

    Vec3 Matrix3::operator*(const Vec3& v) const {
        return {m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z,
                m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z,
                m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z};
    }

    void BoundingBox::extend(const Vec3& p) {
        min.x = std::min(min.x, p.x);
        min.y = std::min(min.y, p.y);
        min.z = std::min(min.z, p.z);
        max.x = std::max(max.x, p.x);
        max.y = std::max(max.y, p.y);
        max.z = std::max(max.z, p.z);
    }

    bool BoundingBox::isInverted() const {
        return !(min.x <= max.x && min.y <= max.y && min.z <= max.z);
    }

    double loopArea(const PolygonLoop& loop) {
        if (loop.size() < 3) {
            return 0.0;
        }
        double twice = 0.0;
        for (size_t i = 0, j = loop.size() - 1; i < loop.size(); j = i++) {
            twice += loop[j].x * loop[i].y - loop[i].x * loop[j].y;
        }
        return std::abs(twice) * 0.5;
    }

} // namespace resinslice
