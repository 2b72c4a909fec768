#include <catch2/catch.hpp>

#include "resinslice/Body.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Mesh.hpp"

#include "test_utils.hpp"

#include <cmath>

using namespace resinslice;
using namespace resinslice::test;

SCENARIO("MeshBuilder: welding a triangle soup", "[Mesh]") {
    GIVEN("The 12 triangles of a unit cube") {
        std::vector<Triangle> soup = cube_triangles();
        Mesh mesh = MeshBuilder::build(soup);

        THEN("Bit-identical corners collapse to 8 vertices") {
            REQUIRE(mesh.vertices.size() == 8);
        }
        THEN("Every triangle survives with valid indices") {
            REQUIRE(mesh.triangleCount() == 12);
            for (uint32_t index : mesh.indices)
                REQUIRE(index < mesh.vertices.size());
        }
        THEN("Volume and bounding box match the cube") {
            REQUIRE(mesh.volume() == Approx(1.0));
            BoundingBox box = mesh.boundingBox();
            REQUIRE(box.min.x == Approx(0.0));
            REQUIRE(box.max.z == Approx(1.0));
        }
        THEN("Vertex normals have unit length and point out of the cube") {
            const Vec3 center(0.5, 0.5, 0.5);
            for (const auto &v : mesh.vertices) {
                Vec3 n(v.normal[0], v.normal[1], v.normal[2]);
                REQUIRE(n.length() == Approx(1.0).margin(1e-5));
                REQUIRE(n.dot(v.point() - center) > 0.0);
            }
        }
    }

    GIVEN("A tilted planar quad made of two coplanar triangles") {
        std::vector<Triangle> soup {
            make_triangle({0, 0, 0}, {1, 0, 0}, {1, 1, 1}),
            make_triangle({0, 0, 0}, {1, 1, 1}, {0, 1, 1}),
        };
        const Vec3 expected = Vec3(0, -1, 1) / std::sqrt(2.0);
        Mesh mesh = MeshBuilder::build(soup);

        THEN("Every vertex normal equals the plane normal") {
            REQUIRE(mesh.vertices.size() == 4);
            for (const auto &v : mesh.vertices) {
                REQUIRE(v.normal[0] == Approx(expected.x).margin(1e-6));
                REQUIRE(v.normal[1] == Approx(expected.y).margin(1e-6));
                REQUIRE(v.normal[2] == Approx(expected.z).margin(1e-6));
            }
        }
    }

    GIVEN("Two triangles sharing an edge and a third that is a sliver") {
        std::vector<Triangle> soup {
            make_triangle({0, 0, 0}, {1, 0, 0}, {1, 1, 0}),
            make_triangle({0, 0, 0}, {1, 1, 0}, {0, 1, 0}),
            make_triangle({0, 0, 0}, {0.5, 0.5, 0}, {1, 1, 0}),
        };

        WHEN("The mesh is built") {
            Mesh mesh = MeshBuilder::build(soup);
            THEN("The collinear triangle is dropped") {
                REQUIRE(mesh.triangleCount() == 2);
            }
            THEN("The shared edge vertices are stored once") {
                REQUIRE(mesh.vertices.size() == 5);
            }
        }

        WHEN("Degenerate triangles are removed explicitly") {
            Mesh mesh = MeshBuilder::weld(soup);
            MeshBuilder::computeVertexNormals(mesh);
            REQUIRE(MeshBuilder::removeDegenerateTriangles(mesh) == 1);
            REQUIRE(MeshBuilder::removeDegenerateTriangles(mesh) == 0);
        }
    }
}

TEST_CASE("Mesh::fromIndexed validates its input", "[Mesh]") {
    std::vector<Vertex> vertices { make_vertex(0, 0, 0), make_vertex(1, 0, 0), make_vertex(0, 1, 0) };

    SECTION("Index count must be a multiple of three") {
        REQUIRE_THROWS_AS(Mesh::fromIndexed(vertices, { 0, 1, 2, 0 }), InputContractViolation);
    }
    SECTION("Indices must reference existing vertices") {
        REQUIRE_THROWS_AS(Mesh::fromIndexed(vertices, { 0, 1, 3 }), InputContractViolation);
    }
    SECTION("A valid triangle is accepted") {
        Mesh mesh = Mesh::fromIndexed(vertices, { 0, 1, 2 });
        REQUIRE(mesh.triangleCount() == 1);
    }
}

TEST_CASE("Mesh::triangle falls back to +Z when vertex normals cancel", "[Mesh]") {
    Mesh mesh = Mesh::fromIndexed({ make_vertex(0, 0, 0), make_vertex(1, 0, 0), make_vertex(0, 1, 0) }, { 0, 1, 2 });
    mesh.vertices[0].normal[2] = 1.f;
    mesh.vertices[1].normal[2] = -1.f;
    mesh.vertices[2].normal[2] = 0.f;

    Triangle tri = mesh.triangle(0);
    REQUIRE(tri.normal[0] == 0.f);
    REQUIRE(tri.normal[1] == 0.f);
    REQUIRE(tri.normal[2] == 1.f);
}

SCENARIO("Body: placing a mesh on the build plate", "[Body]") {
    GIVEN("A unit cube body") {
        Body body("cube", MeshBuilder::build(cube_triangles()));

        THEN("An identity transform leaves the triangles in place") {
            REQUIRE(body.transform().isIdentity());
            BoundingBox box = body.worldMesh().boundingBox();
            REQUIRE(box.min.x == Approx(0.0));
            REQUIRE(box.max.x == Approx(1.0));
        }

        WHEN("It is moved and scaled") {
            body.setPosition({10, 5, 2});
            body.setScale({2, 2, 2});
            Mesh world = body.worldMesh();
            THEN("The bounding box follows") {
                BoundingBox box = world.boundingBox();
                REQUIRE(box.min.x == Approx(10.0));
                REQUIRE(box.max.y == Approx(7.0));
                REQUIRE(box.max.z == Approx(4.0));
            }
            THEN("The volume grows with the cube of the scale") {
                REQUIRE(world.volume() == Approx(8.0));
            }
            THEN("The mesh itself is unchanged") {
                REQUIRE(body.mesh().boundingBox().max.x == Approx(1.0));
            }
        }

        WHEN("It is rotated 90 degrees about Z") {
            body.setRotation({0, 0, 90});
            std::vector<Triangle> world = body.worldTriangles();
            BoundingBox box;
            for (const auto &tri : world)
                for (int i = 0; i < 3; ++i)
                    box.extend(Vec3(tri.vertex(i)[0], tri.vertex(i)[1], tri.vertex(i)[2]));
            THEN("X maps onto Y") {
                REQUIRE(box.min.x == Approx(-1.0).margin(1e-6));
                REQUIRE(box.max.x == Approx(0.0).margin(1e-6));
                REQUIRE(box.min.y == Approx(0.0).margin(1e-6));
                REQUIRE(box.max.y == Approx(1.0).margin(1e-6));
            }
            THEN("Normals stay unit length") {
                for (const auto &tri : world)
                    REQUIRE(Vec3(tri.normal[0], tri.normal[1], tri.normal[2]).length() == Approx(1.0).margin(1e-5));
            }
        }
    }
}

TEST_CASE("Transform applies rotations in X, Y, Z order", "[Body]") {
    Transform t;
    t.rotation = Vec3(90, 90, 0);
    // X first sends +Y to +Z, Y then sends +Z to +X.
    Vec3 p = t.apply(Vec3(0, 1, 0));
    REQUIRE(p.x == Approx(1.0));
    REQUIRE(p.y == Approx(0.0).margin(1e-9));
    REQUIRE(p.z == Approx(0.0).margin(1e-9));
}

TEST_CASE("loopArea is the unsigned shoelace area", "[Geometry]") {
    PolygonLoop ccw { {0, 0, 0}, {2, 0, 0}, {2, 3, 0}, {0, 3, 0} };
    PolygonLoop cw(ccw.rbegin(), ccw.rend());
    REQUIRE(loopArea(ccw) == Approx(6.0));
    REQUIRE(loopArea(cw) == Approx(6.0));
    REQUIRE(loopArea({ {0, 0, 0}, {1, 1, 0} }) == 0.0);
}

TEST_CASE("An empty bounding box is inverted", "[Geometry]") {
    BoundingBox box;
    REQUIRE(box.isInverted());
    box.extend({1, 2, 3});
    REQUIRE_FALSE(box.isInverted());
    REQUIRE(box.width() == 0.0);
}
