#include "resinslice/SliceOrchestrator.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace resinslice {

    SliceOrchestrator::SliceOrchestrator(std::shared_ptr<SliceStrategy> strategy) : strategy_(std::move(strategy)) {
        if (!strategy_) {
            throw std::invalid_argument("SliceOrchestrator requires a strategy");
        }
    }

    std::vector<double> SliceOrchestrator::planeHeights(double minZ, double maxZ, double thickness) {
        if (!std::isfinite(thickness) || thickness <= 0.0) {
            throw InputContractViolation("slice thickness must be positive and finite, got " +
                                         std::to_string(thickness));
        }
        if (!std::isfinite(minZ) || !std::isfinite(maxZ) || minZ > maxZ) {
            throw InputContractViolation("inverted or non-finite Z range");
        }

        std::vector<double> heights;
        for (double z = minZ; z <= maxZ; z += thickness) {
            heights.push_back(z);
            // A thickness too small to move z would never terminate.
            if (z + thickness == z) {
                throw InputContractViolation("slice thickness is below the Z resolution of the model");
            }
        }
        return heights;
    }

    BoundingBox SliceOrchestrator::bounds(const std::vector<Triangle>& triangles) {
        BoundingBox box;
        for (const auto& triangle : triangles) {
            for (int i = 0; i < 3; ++i) {
                const float* v = triangle.vertex(i);
                box.extend(Vec3(v[0], v[1], v[2]));
            }
        }
        return box;
    }

    std::vector<const Body*> SliceOrchestrator::selectBodies(const std::vector<Body>& bodies,
                                                             const SliceRequest& request) {
        std::vector<const Body*> selected;
        if (request.bodies.empty()) {
            for (const auto& body : bodies) {
                if (body.enabled()) {
                    selected.push_back(&body);
                }
            }
            return selected;
        }

        for (const auto& name : request.bodies) {
            auto it = std::find_if(bodies.begin(), bodies.end(), [&](const Body& b) { return b.name() == name; });
            if (it == bodies.end()) {
                throw InputContractViolation("unknown body '" + name + "'");
            }
            if (std::find(selected.begin(), selected.end(), &*it) == selected.end()) {
                selected.push_back(&*it);
            }
        }
        // Keep input order so the merged triangle list does not depend on the filter order.
        std::sort(selected.begin(), selected.end());
        return selected;
    }

    SliceResult SliceOrchestrator::slice(const std::vector<Body>& bodies, const SliceRequest& request) const {
        std::vector<Triangle> merged;
        for (const Body* body : selectBodies(bodies, request)) {
            std::vector<Triangle> world = body->worldTriangles();
            Logger::debug("Body '" + body->name() + "' contributes " + std::to_string(world.size()) + " triangles");
            merged.insert(merged.end(), world.begin(), world.end());
        }
        return slice(merged, request);
    }

    SliceResult SliceOrchestrator::slice(const std::vector<Triangle>& triangles, const SliceRequest& request) const {
        auto start_time = std::chrono::high_resolution_clock::now();

        if (triangles.empty()) {
            throw InputContractViolation("no triangles to slice");
        }
        if (request.width == 0 || request.height == 0) {
            throw InputContractViolation("image dimensions must be positive");
        }

        SliceResult result;
        result.bounds = bounds(triangles);
        if (result.bounds.isInverted()) {
            throw InputContractViolation("inverted bounding box, the mesh has non-finite coordinates");
        }
        result.mapping = RasterMapping::fit(result.bounds, request.width, request.height);

        std::vector<double> heights = planeHeights(result.bounds.min.z, result.bounds.max.z, request.thickness);

        Logger::info("Slicing " + std::to_string(triangles.size()) + " triangles into " +
                     std::to_string(heights.size()) + " planes (" + strategy_->name() + ", " +
                     std::to_string(request.width) + "x" + std::to_string(request.height) + ")");

        std::vector<PlaneResult> planes = strategy_->slicePlanes(triangles, heights, result.mapping);

        SliceStats& stats = result.stats;
        stats.triangles = triangles.size();
        stats.candidatePlanes = heights.size();
        stats.minLoopArea = std::numeric_limits<double>::max();
        double totalArea = 0.0;

        // Plane results are already in Z order.
        for (auto& plane : planes) {
            stats.skippedTriangles += plane.skippedTriangles;
            stats.assembly += plane.assembly;

            if (plane.loops.empty()) {
                ++stats.emptyPlanes;
                continue;
            }

            for (const auto& loop : plane.loops) {
                const double area = loopArea(loop);
                stats.minLoopArea = std::min(stats.minLoopArea, area);
                stats.maxLoopArea = std::max(stats.maxLoopArea, area);
                totalArea += area;
                ++stats.loops;
            }

            SliceLayer layer;
            layer.planeIndex = plane.planeIndex;
            layer.z = plane.z;
            layer.loopCount = plane.loops.size();
            layer.litPixels = plane.image.litPixelCount();
            layer.image = std::move(plane.image);
            result.layers.push_back(std::move(layer));
        }

        if (stats.loops > 0) {
            stats.averageLoopArea = totalArea / static_cast<double>(stats.loops);
        } else {
            stats.minLoopArea = 0.0;
        }

        if (stats.skippedTriangles > 0) {
            Logger::warn("Skipped " + std::to_string(stats.skippedTriangles) + " triangle/plane hits lying in the plane");
        }
        if (stats.assembly.openChains > 0 || stats.assembly.ambiguousVertices > 0) {
            Logger::warn("Contour assembly dropped " + std::to_string(stats.assembly.openChains) +
                         " open chains, met " + std::to_string(stats.assembly.ambiguousVertices) +
                         " ambiguous points");
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        stats.elapsedMs = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        Logger::info("Sliced " + std::to_string(result.layers.size()) + " non-empty layers in " +
                     std::to_string(static_cast<long long>(stats.elapsedMs)) + "ms");

        return result;
    }

} // namespace resinslice
