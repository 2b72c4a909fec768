#pragma once
#include <vector>
#include "resinslice/Geometry.hpp"
#include "resinslice/STLParser.hpp"

namespace resinslice {

    enum class IntersectionKind {
        None,      // triangle does not cross the plane
        Vertex,    // only touches the plane in a single point
        Segment,   // regular transecting triangle
        Coplanar   // more than two distinct points, rejected
    };

    struct PlaneIntersection {
        IntersectionKind kind = IntersectionKind::None;
        std::vector<Vec3> points;
        // Set when points[1] -> points[0] is the outline direction of a Segment hit.
        bool reversed = false;

        // Directed so that the solid lies to the left when viewed from +Z: outer
        // contours run counter-clockwise and holes clockwise.
        Segment segment() const {
            return reversed ? Segment{points[1], points[0]} : Segment{points[0], points[1]};
        }
    };

    class PlaneIntersector {
    public:
        // Intersects one triangle with the horizontal plane z = planeZ.
        //
        // Vertices closer than kPlaneEpsilon to the plane count as lying on it and
        // belong to the upper half-space: a triangle needs at least one vertex strictly
        // below the plane and one on or above it to produce points. The result points
        // are sorted lexicographically with near-duplicates merged; the direction of a
        // segment follows the triangle's vertex winding, which must face outwards.
        static PlaneIntersection intersect(const Triangle& triangle, double planeZ);

        // Appends the segment of every transecting triangle to out; coplanar hits are
        // logged and skipped. Returns the number of skipped triangles.
        static std::size_t collectSegments(const std::vector<Triangle>& triangles, double planeZ,
                                           std::vector<Segment>& out);
    };

} // namespace resinslice
