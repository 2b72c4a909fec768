#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "resinslice/Body.hpp"
#include "resinslice/Geometry.hpp"
#include "resinslice/LayerRasterizer.hpp"
#include "resinslice/SliceStrategy.hpp"

namespace resinslice {

    struct SliceRequest {
        uint32_t width = 0;
        uint32_t height = 0;
        double thickness = 0.0;
        // Names of the bodies to slice. Empty means every enabled body.
        std::vector<std::string> bodies;
    };

    // One non-empty plane of the output stack.
    struct SliceLayer {
        std::size_t planeIndex = 0;
        double z = 0.0;
        SliceImage image;
        std::size_t loopCount = 0;
        std::size_t litPixels = 0;
    };

    struct SliceStats {
        std::size_t triangles = 0;
        std::size_t candidatePlanes = 0;
        std::size_t emptyPlanes = 0;
        std::size_t skippedTriangles = 0;
        AssemblyStats assembly;

        std::size_t loops = 0;
        double minLoopArea = 0.0;
        double maxLoopArea = 0.0;
        double averageLoopArea = 0.0;

        double elapsedMs = 0.0;
    };

    struct SliceResult {
        std::vector<SliceLayer> layers;
        BoundingBox bounds;
        RasterMapping mapping;
        SliceStats stats;
    };

    class SliceOrchestrator {
    public:
        explicit SliceOrchestrator(std::shared_ptr<SliceStrategy> strategy);

        // Merges the world triangles of the selected bodies and slices them. Throws
        // InputContractViolation when a requested body does not exist.
        SliceResult slice(const std::vector<Body>& bodies, const SliceRequest& request) const;

        // Slices an already merged triangle soup; request.bodies is ignored.
        SliceResult slice(const std::vector<Triangle>& triangles, const SliceRequest& request) const;

        const SliceStrategy& strategy() const { return *strategy_; }

        // minZ, minZ + t, minZ + 2t, ... by repeated addition while <= maxZ.
        static std::vector<double> planeHeights(double minZ, double maxZ, double thickness);

        // Bounding box over all triangle vertices.
        static BoundingBox bounds(const std::vector<Triangle>& triangles);

        // Bodies a request selects, in input order.
        static std::vector<const Body*> selectBodies(const std::vector<Body>& bodies, const SliceRequest& request);

    private:
        std::shared_ptr<SliceStrategy> strategy_;
    };

} // namespace resinslice
