#include "resinslice/SliceStrategy.hpp"
#include "resinslice/BoundedAppendBuffer.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/PlaneIntersector.hpp"
#include "resinslice/Tolerances.hpp"
#include <algorithm>
#include <atomic>
#include <limits>
#include <stdexcept>
#include <tuple>

namespace resinslice {

    PlaneResult SliceStrategy::finishPlane(std::size_t planeIndex, double z, const std::vector<Segment>& segments,
                                           std::size_t skippedTriangles, const RasterMapping& mapping) {
        PlaneResult result;
        result.planeIndex = planeIndex;
        result.z = z;
        result.skippedTriangles = skippedTriangles;

        if (segments.empty()) {
            return result;
        }

        AssemblyResult assembled = ContourAssembler::assemble(segments);
        result.assembly = assembled.stats;
        result.loops = std::move(assembled.loops);

        if (result.assembly.openChains > 0) {
            Logger::debug("Plane " + std::to_string(planeIndex) + " at z=" + std::to_string(z) + ": dropped " +
                          std::to_string(result.assembly.openChains) + " open chains");
        }

        if (!result.loops.empty()) {
            result.image = LayerRasterizer::rasterize(result.loops, mapping);
        }
        return result;
    }

    HostParallelStrategy::HostParallelStrategy(std::size_t workers) : workers_(resolveWorkerCount(workers)) {}

    std::vector<PlaneResult> HostParallelStrategy::slicePlanes(const std::vector<Triangle>& triangles,
                                                               const std::vector<double>& planeHeights,
                                                               const RasterMapping& mapping) {
        std::vector<PlaneResult> results(planeHeights.size());

        parallelFor(planeHeights.size(), workers_, 1, [&](std::size_t planeIndex) {
            const double z = planeHeights[planeIndex];
            std::vector<Segment> segments;
            const std::size_t skipped = PlaneIntersector::collectSegments(triangles, z, segments);
            results[planeIndex] = finishPlane(planeIndex, z, segments, skipped, mapping);
        });

        return results;
    }

    BulkOffloadStrategy::BulkOffloadStrategy(std::shared_ptr<ComputeDevice> device, std::size_t capacity)
            : device_(std::move(device)),
              capacity_(capacity) {
        if (!device_) {
            throw std::invalid_argument("BulkOffloadStrategy requires a compute device");
        }
    }

    std::vector<PlaneResult> BulkOffloadStrategy::slicePlanes(const std::vector<Triangle>& triangles,
                                                              const std::vector<double>& planeHeights,
                                                              const RasterMapping& mapping) {
        const std::size_t planeCount = planeHeights.size();
        if (triangles.size() > std::numeric_limits<uint32_t>::max() ||
            planeCount > std::numeric_limits<uint32_t>::max()) {
            throw InputContractViolation("too many triangles or planes for the segment record format");
        }

        // A triangle meets each plane in at most one segment, so triangles x planes
        // bounds the output; the configured capacity is the ceiling.
        std::size_t needed = capacity_;
        if (planeCount == 0 || triangles.size() <= capacity_ / planeCount) {
            needed = triangles.size() * planeCount;
        }
        BoundedAppendBuffer<SegmentRecord> buffer(needed);
        std::vector<std::atomic<std::size_t>> skipped(planeCount);

        // Each work item owns one triangle and only visits the planes its Z span can reach.
        device_->dispatch(triangles.size(), [&](std::size_t triangleIndex) {
            const Triangle& triangle = triangles[triangleIndex];
            const double zMin = std::min({triangle.vertex1[2], triangle.vertex2[2], triangle.vertex3[2]});
            const double zMax = std::max({triangle.vertex1[2], triangle.vertex2[2], triangle.vertex3[2]});

            auto first = std::lower_bound(planeHeights.begin(), planeHeights.end(), zMin);
            auto last = std::upper_bound(first, planeHeights.end(), zMax + 2.0 * kPlaneEpsilon);

            for (auto it = first; it != last; ++it) {
                const auto planeIndex = static_cast<std::size_t>(it - planeHeights.begin());
                PlaneIntersection hit = PlaneIntersector::intersect(triangle, *it);
                if (hit.kind == IntersectionKind::Segment) {
                    SegmentRecord record;
                    record.planeIndex = static_cast<uint32_t>(planeIndex);
                    record.triangleIndex = static_cast<uint32_t>(triangleIndex);
                    record.segment = hit.segment();
                    buffer.append(record);
                } else if (hit.kind == IntersectionKind::Coplanar) {
                    skipped[planeIndex].fetch_add(1, std::memory_order_relaxed);
                }
            }
        });

        buffer.checkCapacity("segment buffer");

        std::vector<SegmentRecord> records = buffer.take();
        Logger::debug("Offload kernel produced " + std::to_string(records.size()) + " segments over " +
                      std::to_string(planeCount) + " planes");

        // Restore the order the host sweep would have produced: by plane, then triangle.
        std::sort(records.begin(), records.end(), [](const SegmentRecord& a, const SegmentRecord& b) {
            return std::tie(a.planeIndex, a.triangleIndex) < std::tie(b.planeIndex, b.triangleIndex);
        });

        std::vector<std::vector<Segment>> planeSegments(planeCount);
        for (const auto& record : records) {
            planeSegments[record.planeIndex].push_back(record.segment);
        }

        std::vector<PlaneResult> results(planeCount);
        device_->dispatch(planeCount, [&](std::size_t planeIndex) {
            results[planeIndex] = finishPlane(planeIndex, planeHeights[planeIndex], planeSegments[planeIndex],
                                              skipped[planeIndex].load(), mapping);
        });

        return results;
    }

    std::shared_ptr<SliceStrategy> makeStrategy(const std::string& name, std::size_t workers,
                                                std::size_t offloadCapacity) {
        if (name == "host-parallel") {
            return std::make_shared<HostParallelStrategy>(workers);
        }
        if (name == "bulk-offload") {
            return std::make_shared<BulkOffloadStrategy>(std::make_shared<ThreadPoolDevice>(workers), offloadCapacity);
        }
        throw std::runtime_error("Unknown slice strategy: " + name);
    }

} // namespace resinslice
