#include "resinslice/PlaneIntersector.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Tolerances.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace resinslice {

    namespace {
        bool lexicographicLess(const Vec3& a, const Vec3& b) {
            return std::tie(a.x, a.y, a.z) < std::tie(b.x, b.y, b.z);
        }
    }

    PlaneIntersection PlaneIntersector::intersect(const Triangle& triangle, double planeZ) {
        PlaneIntersection result;

        Vec3 points[3];
        double distances[3];
        bool below = false;
        bool onOrAbove = false;

        for (int i = 0; i < 3; ++i) {
            const float* v = triangle.vertex(i);
            points[i] = Vec3(v[0], v[1], v[2]);
            distances[i] = points[i].z - planeZ;
            if (distances[i] < -kPlaneEpsilon) {
                below = true;
            } else {
                onOrAbove = true;
            }
        }

        if (!(below && onOrAbove)) {
            return result;
        }

        std::vector<Vec3>& hits = result.points;
        for (int i = 0; i < 3; ++i) {
            const Vec3& p1 = points[i];
            const Vec3& p2 = points[(i + 1) % 3];
            const double d1 = distances[i];
            const double d2 = distances[(i + 1) % 3];

            const bool p1On = std::abs(d1) <= kPlaneEpsilon;
            const bool p2On = std::abs(d2) <= kPlaneEpsilon;

            if ((d1 > kPlaneEpsilon && d2 < -kPlaneEpsilon) || (d1 < -kPlaneEpsilon && d2 > kPlaneEpsilon)) {
                const double t = d1 / (d1 - d2);
                hits.push_back(p1 + (p2 - p1) * t);
            } else {
                if (p1On) hits.push_back(p1);
                if (p2On) hits.push_back(p2);
            }
        }

        std::sort(hits.begin(), hits.end(), lexicographicLess);
        hits.erase(std::unique(hits.begin(), hits.end(),
                               [](const Vec3& a, const Vec3& b) { return (a - b).length() < kPlaneEpsilon; }),
                   hits.end());

        switch (hits.size()) {
            case 0:
                result.kind = IntersectionKind::None;
                break;
            case 1:
                result.kind = IntersectionKind::Vertex;
                break;
            case 2: {
                result.kind = IntersectionKind::Segment;
                // Outward normal must lie to the right of the segment direction.
                const Vec3 normal = (points[1] - points[0]).cross(points[2] - points[0]);
                const Vec3 dir = hits[1] - hits[0];
                result.reversed = dir.y * normal.x - dir.x * normal.y < 0.0;
                break;
            }
            default:
                result.kind = IntersectionKind::Coplanar;
                break;
        }
        return result;
    }

    std::size_t PlaneIntersector::collectSegments(const std::vector<Triangle>& triangles, double planeZ,
                                                  std::vector<Segment>& out) {
        std::size_t skipped = 0;
        for (const auto& triangle : triangles) {
            PlaneIntersection hit = intersect(triangle, planeZ);
            if (hit.kind == IntersectionKind::Segment) {
                out.push_back(hit.segment());
            } else if (hit.kind == IntersectionKind::Coplanar) {
                Logger::debug("Skipped a triangle intersecting the plane in " + std::to_string(hit.points.size()) +
                              " points at z=" + std::to_string(planeZ));
                ++skipped;
            }
        }
        return skipped;
    }

} // namespace resinslice
