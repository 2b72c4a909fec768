#include <catch2/catch.hpp>

#include "resinslice/PlaneIntersector.hpp"
#include "resinslice/Tolerances.hpp"

#include "test_utils.hpp"

using namespace resinslice;
using namespace resinslice::test;

TEST_CASE("A triangle on one side of the plane yields nothing", "[Intersector]") {
    Triangle tri = make_triangle({0, 0, 1}, {1, 0, 2}, {0, 1, 3});

    SECTION("Plane below") {
        PlaneIntersection hit = PlaneIntersector::intersect(tri, 0.5);
        REQUIRE(hit.kind == IntersectionKind::None);
        REQUIRE(hit.points.empty());
    }
    SECTION("Plane above") {
        REQUIRE(PlaneIntersector::intersect(tri, 3.5).kind == IntersectionKind::None);
    }
}

TEST_CASE("A transecting triangle yields one segment", "[Intersector]") {
    Triangle tri = make_triangle({0, 0, 0}, {2, 0, 2}, {0, 2, 2});
    PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0);

    REQUIRE(hit.kind == IntersectionKind::Segment);
    REQUIRE(hit.points.size() == 2);

    // Points come back sorted lexicographically.
    Segment s = hit.segment();
    REQUIRE_FALSE(hit.reversed);
    REQUIRE(s.a.x == Approx(0.0).margin(1e-12));
    REQUIRE(s.a.y == Approx(1.0));
    REQUIRE(s.b.x == Approx(1.0));
    REQUIRE(s.b.y == Approx(0.0).margin(1e-12));
    REQUIRE(s.a.z == Approx(1.0));
    REQUIRE(s.b.z == Approx(1.0));
}

SCENARIO("Vertices lying on the plane", "[Intersector]") {
    GIVEN("One vertex on the plane and the other two above it") {
        Triangle tri = make_triangle({0, 0, 1}, {1, 0, 2}, {0, 1, 2});
        THEN("No point is produced") {
            REQUIRE(PlaneIntersector::intersect(tri, 1.0).points.empty());
        }
    }
    GIVEN("One vertex on the plane and the other two below it") {
        Triangle tri = make_triangle({0, 0, 1}, {1, 0, 0}, {0, 1, 0});
        THEN("Only the touching vertex is reported, never a segment") {
            PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0);
            REQUIRE(hit.kind == IntersectionKind::Vertex);
            REQUIRE(hit.points.size() == 1);
        }
    }
    GIVEN("One vertex on the plane, one above and one below") {
        Triangle tri = make_triangle({0, 0, 1}, {2, 0, 2}, {2, 0, 0});
        THEN("The segment runs from the vertex to the opposite edge") {
            PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0);
            REQUIRE(hit.kind == IntersectionKind::Segment);
            REQUIRE(hit.points[0].x == Approx(0.0).margin(1e-12));
            REQUIRE(hit.points[1].x == Approx(2.0));
        }
    }
    GIVEN("An edge lying in the plane with the third vertex below") {
        Triangle tri = make_triangle({0, 0, 1}, {1, 0, 1}, {0, 0.5, 0});
        THEN("The edge itself is the segment") {
            PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0);
            REQUIRE(hit.kind == IntersectionKind::Segment);
            REQUIRE(hit.points[0].x == Approx(0.0).margin(1e-12));
            REQUIRE(hit.points[1].x == Approx(1.0));
        }
    }
    GIVEN("A triangle lying in the plane") {
        Triangle tri = make_triangle({0, 0, 1}, {1, 0, 1}, {0, 1, 1});
        THEN("It contributes no segment") {
            std::vector<Segment> segments;
            PlaneIntersector::collectSegments({ tri }, 1.0, segments);
            REQUIRE(segments.empty());
        }
    }
}

TEST_CASE("Distances within epsilon count as on the plane", "[Intersector]") {
    const double nudge = kPlaneEpsilon / 2.0;
    Triangle tri = make_triangle({0, 0, 0}, {1, 0, 1}, {0, 1, 1});
    // A plane hair-thin above the top edge still catches it.
    PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0 + nudge);
    REQUIRE(hit.kind == IntersectionKind::Segment);
}

SCENARIO("Segments follow the outline of the solid", "[Intersector]") {
    GIVEN("A wall facing -Y, wound outwards") {
        Triangle tri = make_triangle({0, 0, 0}, {2, 0, 0}, {0, 0, 2});

        THEN("Its segment runs towards +X, keeping the solid on the left") {
            PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0);
            REQUIRE(hit.kind == IntersectionKind::Segment);
            Segment s = hit.segment();
            REQUIRE(s.b.x > s.a.x);
        }
    }
    GIVEN("The same wall wound the other way") {
        Triangle tri = make_triangle({0, 0, 0}, {0, 0, 2}, {2, 0, 0});

        THEN("The segment is reversed while the sorted points stay put") {
            PlaneIntersection hit = PlaneIntersector::intersect(tri, 1.0);
            REQUIRE(hit.reversed);
            REQUIRE(hit.points[0].x < hit.points[1].x);
            Segment s = hit.segment();
            REQUIRE(s.b.x < s.a.x);
        }
    }
    GIVEN("A unit cube cut at mid height") {
        std::vector<Segment> segments;
        PlaneIntersector::collectSegments(cube_triangles(), 0.5, segments);

        THEN("The segments wind counter-clockwise around the section") {
            double twiceArea = 0.0;
            for (const auto &s : segments)
                twiceArea += s.a.x * s.b.y - s.b.x * s.a.y;
            REQUIRE(twiceArea / 2.0 == Approx(1.0));
        }
    }
}

TEST_CASE("collectSegments walks every triangle of a cube", "[Intersector]") {
    std::vector<Triangle> cube = cube_triangles();
    std::vector<Segment> segments;

    SECTION("Mid-height plane crosses all 8 side triangles") {
        REQUIRE(PlaneIntersector::collectSegments(cube, 0.5, segments) == 0);
        REQUIRE(segments.size() == 8);
    }
    SECTION("Top plane catches the 4 top edges only") {
        PlaneIntersector::collectSegments(cube, 1.0, segments);
        REQUIRE(segments.size() == 4);
    }
    SECTION("Bottom plane produces nothing") {
        PlaneIntersector::collectSegments(cube, 0.0, segments);
        REQUIRE(segments.empty());
    }
}
