#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "resinslice/Body.hpp"
#include "resinslice/IslandAnalyzer.hpp"
#include "resinslice/SliceOrchestrator.hpp"
#include "resinslice/SliceStrategy.hpp"
#include "resinslice/TriangleReader.hpp"

namespace resinslice {

    struct ModelInput {
        std::string name;
        // Path for the STL reader, key for the in-memory one.
        std::string source;
        Transform transform;
        bool enabled = true;
    };

    struct JobRequest {
        std::vector<ModelInput> models;
        SliceRequest slice;
    };

    struct BodySummary {
        std::string name;
        bool enabled = true;
        std::size_t sourceTriangles = 0;
        std::size_t triangles = 0;
        std::size_t vertices = 0;
        double volume = 0.0;
        BoundingBox bounds;
        std::string fingerprint;
    };

    struct BodyIslands {
        std::string name;
        IslandReport report;
    };

    struct JobResult {
        std::string jobId;
        std::vector<BodySummary> bodies;
        std::vector<BodyIslands> islands;
        // Left empty by analyzeIslands().
        SliceResult slice;
    };

    // The whole pipeline behind one request: read and fingerprint the models, build
    // meshes, place the bodies, look for support islands, slice.
    class SliceService {
    public:
        SliceService(std::shared_ptr<TriangleReader> reader, std::shared_ptr<SliceStrategy> strategy,
                     IslandConfig islandConfig = IslandConfig());

        // STL files on disk, strategy and island settings from EnvironmentHandler.
        static SliceService fromEnvironment();

        JobResult run(const JobRequest& request) const;
        JobResult analyzeIslands(const JobRequest& request) const;

        // Reads every model into a placed body. Fills summaries and returns the job id
        // through jobId when they are not null.
        std::vector<Body> loadBodies(const JobRequest& request, std::vector<BodySummary>* summaries,
                                     std::string* jobId) const;

        const SliceOrchestrator& orchestrator() const { return orchestrator_; }

    private:
        std::vector<BodyIslands> findIslands(const std::vector<Body>& bodies, const SliceRequest& request) const;

        std::shared_ptr<TriangleReader> reader_;
        SliceOrchestrator orchestrator_;
        IslandConfig islandConfig_;
    };

} // namespace resinslice
