#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include "resinslice/Geometry.hpp"

namespace resinslice {

    struct AssemblyStats {
        std::size_t segments = 0;
        // Segments whose two endpoints quantize to the same key.
        std::size_t collapsedSegments = 0;
        // Walks that ran out of edges before returning to their start.
        std::size_t openChains = 0;
        // Quantized points where more than one segment starts. The stitch through such
        // a point is arbitrary.
        std::size_t ambiguousVertices = 0;

        AssemblyStats& operator+=(const AssemblyStats& other);
    };

    struct AssemblyResult {
        std::vector<PolygonLoop> loops;
        AssemblyStats stats;
    };

    class ContourAssembler {
    public:
        using Key = std::pair<int64_t, int64_t>;

        // Snaps the XY coordinates of a point onto the kContourEpsilon grid.
        static Key quantize(const Vec3& p);

        // Stitches an unordered set of directed segments taken at one plane height into
        // closed loops, following each segment from a to b. Every returned loop has at
        // least 3 points, keeps the direction of its segments and closes on its first
        // point; open chains are dropped. At a point where more than one segment starts
        // the walk continues along the first-registered unused edge, so the output only
        // depends on the order of the input segments.
        static AssemblyResult assemble(const std::vector<Segment>& segments);
    };

} // namespace resinslice
