#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "resinslice/ComputeDevice.hpp"
#include "resinslice/ContourAssembler.hpp"
#include "resinslice/Geometry.hpp"
#include "resinslice/LayerRasterizer.hpp"
#include "resinslice/STLParser.hpp"

namespace resinslice {

    // Everything produced for one candidate plane, empty or not.
    struct PlaneResult {
        std::size_t planeIndex = 0;
        double z = 0.0;
        std::vector<PolygonLoop> loops;
        SliceImage image;
        AssemblyStats assembly;
        std::size_t skippedTriangles = 0;
    };

    // One segment produced by the offload kernel, tagged with where it came from.
    struct SegmentRecord {
        uint32_t planeIndex = 0;
        uint32_t triangleIndex = 0;
        Segment segment;
    };

    // Runs intersect -> assemble -> rasterize for every plane height. Results come back
    // indexed by plane, in plane order, whatever order the work actually ran in.
    class SliceStrategy {
    public:
        virtual ~SliceStrategy() = default;

        virtual std::vector<PlaneResult> slicePlanes(const std::vector<Triangle>& triangles,
                                                     const std::vector<double>& planeHeights,
                                                     const RasterMapping& mapping) = 0;

        virtual std::string name() const = 0;

    protected:
        // Contour assembly and rasterization for one plane's segments.
        static PlaneResult finishPlane(std::size_t planeIndex, double z, const std::vector<Segment>& segments,
                                       std::size_t skippedTriangles, const RasterMapping& mapping);
    };

    // Plane sweep split over worker threads. Each worker claims a plane index from an
    // atomic cursor and owns that plane's segments and adjacency map.
    class HostParallelStrategy : public SliceStrategy {
    public:
        // workers == 0 picks one per hardware thread.
        explicit HostParallelStrategy(std::size_t workers = 0);

        std::vector<PlaneResult> slicePlanes(const std::vector<Triangle>& triangles,
                                             const std::vector<double>& planeHeights,
                                             const RasterMapping& mapping) override;

        std::string name() const override { return "host-parallel"; }

        std::size_t workers() const { return workers_; }

    private:
        std::size_t workers_;
    };

    // Segment collection as one kernel over all triangles, each work item testing its
    // triangle against every plane and appending into a bounded buffer. Assembly and
    // rasterization then run per plane on the same device.
    class BulkOffloadStrategy : public SliceStrategy {
    public:
        BulkOffloadStrategy(std::shared_ptr<ComputeDevice> device, std::size_t capacity);

        // Throws ResourceExhaustion when the kernel produced more than `capacity` segments.
        std::vector<PlaneResult> slicePlanes(const std::vector<Triangle>& triangles,
                                             const std::vector<double>& planeHeights,
                                             const RasterMapping& mapping) override;

        std::string name() const override { return "bulk-offload"; }

        std::size_t capacity() const { return capacity_; }
        const ComputeDevice& device() const { return *device_; }

    private:
        std::shared_ptr<ComputeDevice> device_;
        std::size_t capacity_;
    };

    // Builds a strategy from its configured name ("host-parallel" or "bulk-offload").
    // Throws std::runtime_error for anything else.
    std::shared_ptr<SliceStrategy> makeStrategy(const std::string& name, std::size_t workers,
                                                std::size_t offloadCapacity);

} // namespace resinslice
