#include <catch2/catch.hpp>

#include "resinslice/Errors.hpp"
#include "resinslice/IslandAnalyzer.hpp"
#include "resinslice/Mesh.hpp"

#include "test_utils.hpp"

using namespace resinslice;
using namespace resinslice::test;

SCENARIO("Support islands of flat squares", "[Islands]") {
    GIVEN("A square lying on the build platform") {
        IslandReport report = IslandAnalyzer::analyze(square_mesh(0.0));
        THEN("Nothing needs support") {
            REQUIRE(report.islandIndices.empty());
            REQUIRE(report.uniquePositions.empty());
        }
    }

    GIVEN("The same square hovering at z = 1") {
        IslandReport report = IslandAnalyzer::analyze(square_mesh(1.0));
        THEN("All four corners are islands") {
            REQUIRE(report.islandIndices == std::vector<uint32_t>{ 0, 1, 2, 3 });
            REQUIRE(report.uniquePositions.size() == 4);
        }
    }

    GIVEN("A square with a stray vertex that no triangle uses") {
        Mesh mesh = square_mesh(0.0);
        mesh.vertices.push_back(make_vertex(5, 5, 2));
        IslandReport report = IslandAnalyzer::analyze(mesh);
        THEN("The stray vertex is an island") {
            REQUIRE(report.islandIndices == std::vector<uint32_t>{ 4 });
            REQUIRE(report.isIsland.size() == 5);
            REQUIRE(report.isIsland[4]);
        }
    }
}

SCENARIO("Support islands of a cube", "[Islands]") {
    GIVEN("A cube standing on the platform") {
        Mesh mesh = MeshBuilder::build(cube_triangles());
        THEN("It has no islands") {
            REQUIRE(IslandAnalyzer::analyze(mesh).islandIndices.empty());
        }
    }

    GIVEN("A cube floating one unit above the platform") {
        Mesh mesh = MeshBuilder::build(cube_triangles(1.0, {0, 0, 1}));
        IslandReport report = IslandAnalyzer::analyze(mesh);

        THEN("Its four corners nearest the platform are islands") {
            REQUIRE(report.islandIndices.size() == 4);
            for (const auto &p : report.uniquePositions)
                REQUIRE(p.z == Approx(1.0));
        }

        WHEN("The platform is configured at the cube's base") {
            IslandConfig config;
            config.platformZ = 1.0;
            THEN("The cube is supported again") {
                REQUIRE(IslandAnalyzer::analyze(mesh, config).islandIndices.empty());
            }
        }

        WHEN("Up is flipped to +Z") {
            IslandConfig config;
            config.up = Vec3(0, 0, 1);
            THEN("The opposite face corners become the islands") {
                IslandReport flipped = IslandAnalyzer::analyze(mesh, config);
                REQUIRE(flipped.islandIndices.size() == 4);
                for (const auto &p : flipped.uniquePositions)
                    REQUIRE(p.z == Approx(2.0));
            }
        }
    }
}

TEST_CASE("Duplicated island positions are reported once", "[Islands]") {
    // Two triangles that were never welded, sharing the corner (1, 0, 3).
    Mesh mesh = Mesh::fromIndexed({ make_vertex(0, 0, 3), make_vertex(1, 0, 3), make_vertex(0, 1, 3),
                                     make_vertex(1, 0, 3), make_vertex(2, 0, 3), make_vertex(1, 1, 3) },
                                   { 0, 1, 2, 3, 4, 5 });
    IslandReport report = IslandAnalyzer::analyze(mesh);
    REQUIRE(report.islandIndices.size() == 6);
    REQUIRE(report.uniquePositions.size() == 5);
}

TEST_CASE("Island analysis validates its input", "[Islands]") {
    Mesh mesh = square_mesh(1.0);

    SECTION("Zero up vector") {
        IslandConfig config;
        config.up = Vec3(0, 0, 0);
        REQUIRE_THROWS_AS(IslandAnalyzer::analyze(mesh, config), InputContractViolation);
    }
    SECTION("Index out of range") {
        mesh.indices.back() = 42;
        REQUIRE_THROWS_AS(IslandAnalyzer::analyze(mesh), InputContractViolation);
    }
}
