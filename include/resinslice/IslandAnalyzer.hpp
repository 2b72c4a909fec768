#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "resinslice/Geometry.hpp"
#include "resinslice/Mesh.hpp"

namespace resinslice {

    struct IslandConfig {
        // Physical up in model coordinates. Resin parts hang from the platform, so
        // model -Z points away from the vat.
        Vec3 up{0.0, 0.0, -1.0};
        double platformZ = 0.0;
    };

    struct IslandReport {
        // One flag per mesh vertex.
        std::vector<bool> isIsland;
        // Indices of island vertices, ascending.
        std::vector<uint32_t> islandIndices;
        // Island positions with duplicates (equal to 6 decimals) removed, first index wins.
        std::vector<Vec3> uniquePositions;
    };

    class IslandAnalyzer {
    public:
        // Flags vertices that would start printing in mid-air. A vertex is an island
        // unless it sits on the platform or one of its neighbors lies further along
        // `up`. Edges perpendicular to `up` and zero-length edges carry no information;
        // a vertex left with no informative neighbor is an island.
        //
        // Throws InputContractViolation for out-of-range indices or a zero `up`.
        static IslandReport analyze(const Mesh& mesh, const IslandConfig& config = IslandConfig());
    };

} // namespace resinslice
