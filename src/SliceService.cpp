#include "resinslice/SliceService.hpp"
#include "resinslice/EnvironmentHandler.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Hasher.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Mesh.hpp"

#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

namespace resinslice {

    namespace {
        long long elapsedMs(std::chrono::high_resolution_clock::time_point since) {
            auto now = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count();
        }

        void writeVec(std::ostream& out, const Vec3& v) {
            out << v.x << ',' << v.y << ',' << v.z << ';';
        }
    }

    SliceService::SliceService(std::shared_ptr<TriangleReader> reader, std::shared_ptr<SliceStrategy> strategy,
                               IslandConfig islandConfig)
            : reader_(std::move(reader)),
              orchestrator_(std::move(strategy)),
              islandConfig_(islandConfig) {
        if (!reader_) {
            throw std::invalid_argument("SliceService requires a triangle reader");
        }
    }

    SliceService SliceService::fromEnvironment() {
        auto& env = EnvironmentHandler::instance();

        IslandConfig islands;
        islands.platformZ = env.getPlatformZ();

        return SliceService(std::make_shared<StlTriangleReader>(),
                            makeStrategy(env.getStrategy(), env.getWorkerCount(), env.getOffloadCapacity()),
                            islands);
    }

    std::vector<Body> SliceService::loadBodies(const JobRequest& request, std::vector<BodySummary>* summaries,
                                               std::string* jobId) const {
        if (request.models.empty()) {
            throw InputContractViolation("request contains no models");
        }

        std::ostringstream identity;
        identity << std::setprecision(17);

        std::vector<Body> bodies;
        bodies.reserve(request.models.size());
        std::set<std::string> names;

        for (std::size_t i = 0; i < request.models.size(); ++i) {
            const ModelInput& model = request.models[i];
            const std::string name = model.name.empty() ? "body-" + std::to_string(i) : model.name;
            // Bodies are addressed by name in filters and island reports.
            if (!names.insert(name).second) {
                throw InputContractViolation("duplicate body name '" + name + "'");
            }

            auto read_start = std::chrono::high_resolution_clock::now();
            Logger::info("Reading model '" + name + "' from " + model.source);
            std::vector<Triangle> triangles = reader_->readTriangles(model.source);
            Logger::info("Read " + std::to_string(triangles.size()) + " triangles in " +
                         std::to_string(elapsedMs(read_start)) + "ms");

            std::string fingerprint = reader_->fingerprint(model.source);
            Logger::info("Hash: " + fingerprint);

            auto build_start = std::chrono::high_resolution_clock::now();
            Mesh mesh = MeshBuilder::build(triangles);
            Logger::info("Mesh built in " + std::to_string(elapsedMs(build_start)) + "ms");

            Body body(name, std::move(mesh));
            body.setTransform(model.transform);
            body.setEnabled(model.enabled);

            if (summaries) {
                BodySummary summary;
                summary.name = name;
                summary.enabled = model.enabled;
                summary.sourceTriangles = triangles.size();
                summary.triangles = body.mesh().triangleCount();
                summary.vertices = body.mesh().vertices.size();
                Mesh world = body.worldMesh();
                summary.volume = world.volume();
                summary.bounds = world.boundingBox();
                summary.fingerprint = fingerprint;
                summaries->push_back(summary);
            }

            identity << name << '|' << fingerprint << '|' << model.enabled << '|';
            writeVec(identity, model.transform.position);
            writeVec(identity, model.transform.rotation);
            writeVec(identity, model.transform.scale);

            bodies.push_back(std::move(body));
        }

        if (jobId) {
            const SliceRequest& slice = request.slice;
            identity << slice.width << 'x' << slice.height << '@' << slice.thickness << '|';
            for (const auto& selected : slice.bodies) {
                identity << selected << ',';
            }
            *jobId = Hasher::sha256(identity.str());
        }
        return bodies;
    }

    std::vector<BodyIslands> SliceService::findIslands(const std::vector<Body>& bodies,
                                                       const SliceRequest& request) const {
        std::vector<BodyIslands> result;
        for (const Body* body : SliceOrchestrator::selectBodies(bodies, request)) {
            auto start = std::chrono::high_resolution_clock::now();
            BodyIslands islands;
            islands.name = body->name();
            islands.report = IslandAnalyzer::analyze(body->worldMesh(), islandConfig_);
            Logger::info("Body '" + body->name() + "': " + std::to_string(islands.report.uniquePositions.size()) +
                         " support islands found in " + std::to_string(elapsedMs(start)) + "ms");
            result.push_back(std::move(islands));
        }
        return result;
    }

    JobResult SliceService::run(const JobRequest& request) const {
        auto start_time = std::chrono::high_resolution_clock::now();

        JobResult result;
        std::vector<Body> bodies = loadBodies(request, &result.bodies, &result.jobId);
        Logger::info("Start slicing job " + result.jobId);

        result.islands = findIslands(bodies, request.slice);
        result.slice = orchestrator_.slice(bodies, request.slice);

        Logger::info("Completed job " + result.jobId + ": " + std::to_string(result.slice.layers.size()) +
                     " layers in " + std::to_string(elapsedMs(start_time)) + "ms");
        return result;
    }

    JobResult SliceService::analyzeIslands(const JobRequest& request) const {
        JobResult result;
        std::vector<Body> bodies = loadBodies(request, &result.bodies, &result.jobId);
        result.islands = findIslands(bodies, request.slice);
        return result;
    }

} // namespace resinslice
