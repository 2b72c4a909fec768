#include "resinslice/JsonCodec.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Hasher.hpp"
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace resinslice {

    namespace {
        Vec3 parseVec(const json& body, const char* key, const Vec3& fallback) {
            if (!body.contains(key)) {
                return fallback;
            }
            const json& value = body.at(key);
            if (!value.is_array() || value.size() != 3) {
                throw InputContractViolation(std::string("'") + key + "' must be an array of 3 numbers");
            }
            return Vec3(value.at(0).get<double>(), value.at(1).get<double>(), value.at(2).get<double>());
        }

        uint32_t parseDimension(const json& body, const char* key, uint32_t fallback) {
            if (!body.contains(key)) {
                return fallback;
            }
            const int64_t value = body.at(key).get<int64_t>();
            if (value <= 0 || value > std::numeric_limits<uint32_t>::max()) {
                throw InputContractViolation(std::string("'") + key + "' must be a positive integer");
            }
            return static_cast<uint32_t>(value);
        }

        json vecJson(const Vec3& v) {
            return json::array({v.x, v.y, v.z});
        }
    }

    JobRequest JsonCodec::parseJobRequest(const json& body, const EnvironmentHandler& defaults) {
        try {
            if (!body.is_object()) {
                throw InputContractViolation("request body must be a JSON object");
            }

            JobRequest request;
            for (const auto& entry : body.at("models")) {
                ModelInput model;
                model.source = entry.at("path").get<std::string>();
                model.name = entry.value("name", std::string());
                model.enabled = entry.value("enabled", true);
                model.transform.position = parseVec(entry, "position", model.transform.position);
                model.transform.rotation = parseVec(entry, "rotation", model.transform.rotation);
                model.transform.scale = parseVec(entry, "scale", model.transform.scale);
                request.models.push_back(model);
            }

            request.slice.width = parseDimension(body, "width", defaults.getImageWidth());
            request.slice.height = parseDimension(body, "height", defaults.getImageHeight());
            request.slice.thickness = body.value("thickness", defaults.getSliceThickness());
            if (body.contains("bodies")) {
                request.slice.bodies = body.at("bodies").get<std::vector<std::string>>();
            }
            return request;
        } catch (const json::exception& e) {
            throw InputContractViolation(std::string("malformed request: ") + e.what());
        }
    }

    json JsonCodec::toJson(const BoundingBox& box) {
        return json{{"min", vecJson(box.min)}, {"max", vecJson(box.max)}};
    }

    json JsonCodec::toJson(const IslandReport& report) {
        json positions = json::array();
        for (const auto& p : report.uniquePositions) {
            positions.push_back(vecJson(p));
        }
        return json{
                {"island_vertices", report.islandIndices},
                {"unique_positions", positions},
                {"count", report.uniquePositions.size()}
        };
    }

    json JsonCodec::toJson(const SliceLayer& layer) {
        const auto& pixels = layer.image.pixels();
        return json{
                {"plane", layer.planeIndex},
                {"z", layer.z},
                {"loops", layer.loopCount},
                {"lit_pixels", layer.litPixels},
                {"image_hash", Hasher::sha256(pixels.data(), pixels.size())}
        };
    }

    json JsonCodec::toJson(const JobResult& result, bool includeSlices) {
        json bodies = json::array();
        for (const auto& body : result.bodies) {
            bodies.push_back({
                    {"name", body.name},
                    {"enabled", body.enabled},
                    {"source_triangles", body.sourceTriangles},
                    {"triangles", body.triangles},
                    {"vertices", body.vertices},
                    {"volume", body.volume},
                    {"bounds", toJson(body.bounds)},
                    {"hash", body.fingerprint}
            });
        }

        json islands = json::object();
        for (const auto& entry : result.islands) {
            islands[entry.name] = toJson(entry.report);
        }

        json out{
                {"job_id", result.jobId},
                {"bodies", bodies},
                {"islands", islands}
        };

        if (includeSlices) {
            const SliceResult& slice = result.slice;
            json layers = json::array();
            for (const auto& layer : slice.layers) {
                layers.push_back(toJson(layer));
            }
            const SliceStats& stats = slice.stats;
            out["slice"] = {
                    {"width", slice.mapping.width},
                    {"height", slice.mapping.height},
                    {"scale", slice.mapping.scale},
                    {"bounds", toJson(slice.bounds)},
                    {"layers", layers},
                    {"stats", {
                            {"triangles", stats.triangles},
                            {"candidate_planes", stats.candidatePlanes},
                            {"empty_planes", stats.emptyPlanes},
                            {"skipped_triangles", stats.skippedTriangles},
                            {"open_chains", stats.assembly.openChains},
                            {"ambiguous_vertices", stats.assembly.ambiguousVertices},
                            {"collapsed_segments", stats.assembly.collapsedSegments},
                            {"loops", stats.loops},
                            {"min_loop_area", stats.minLoopArea},
                            {"max_loop_area", stats.maxLoopArea},
                            {"average_loop_area", stats.averageLoopArea},
                            {"elapsed_ms", stats.elapsedMs}
                    }}
            };
        }
        return out;
    }

} // namespace resinslice
