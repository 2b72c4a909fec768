#include "resinslice/IslandAnalyzer.hpp"
#include "resinslice/Errors.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Tolerances.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>
#include <string>

namespace resinslice {

    namespace {
        std::string positionKey(const Vec3& p) {
            char buffer[128];
            std::snprintf(buffer, sizeof(buffer), "%.6f,%.6f,%.6f", p.x, p.y, p.z);
            return buffer;
        }
    }

    IslandReport IslandAnalyzer::analyze(const Mesh& mesh, const IslandConfig& config) {
        const double upLength = config.up.length();
        if (!(upLength > 0.0) || !std::isfinite(upLength)) {
            throw InputContractViolation("island analysis needs a non-zero up direction");
        }
        if (mesh.indices.size() % 3 != 0) {
            throw InputContractViolation("index count " + std::to_string(mesh.indices.size()) +
                                         " is not a multiple of 3");
        }

        const Vec3 up = config.up / upLength;
        const std::size_t vertexCount = mesh.vertices.size();

        // Unique neighbors per vertex, self excluded.
        std::vector<std::vector<uint32_t>> neighbors(vertexCount);
        for (std::size_t i = 0; i < mesh.indices.size(); i += 3) {
            const uint32_t corners[3] = {mesh.indices[i], mesh.indices[i + 1], mesh.indices[i + 2]};
            for (uint32_t corner : corners) {
                if (corner >= vertexCount) {
                    throw InputContractViolation("vertex index " + std::to_string(corner) + " out of range");
                }
            }
            for (uint32_t corner : corners) {
                for (uint32_t other : corners) {
                    if (other != corner) {
                        neighbors[corner].push_back(other);
                    }
                }
            }
        }
        for (auto& list : neighbors) {
            std::sort(list.begin(), list.end());
            list.erase(std::unique(list.begin(), list.end()), list.end());
        }

        IslandReport report;
        report.isIsland.assign(vertexCount, false);
        std::set<std::string> seenPositions;

        for (std::size_t index = 0; index < vertexCount; ++index) {
            const Vec3 position = mesh.vertices[index].point();
            if (std::abs(position.z - config.platformZ) <= kIslandEpsilon) {
                continue;
            }

            bool island = true;
            for (uint32_t neighbor : neighbors[index]) {
                const Vec3 direction = position - mesh.vertices[neighbor].point();
                const double length = direction.length();
                if (length == 0.0) {
                    continue;
                }
                const double alignment = (direction / length).dot(up);
                if (std::abs(alignment) <= kIslandEpsilon) {
                    continue;
                }
                if (alignment <= 0.0) {
                    island = false;
                    break;
                }
            }

            if (!island) {
                continue;
            }

            report.isIsland[index] = true;
            report.islandIndices.push_back(static_cast<uint32_t>(index));
            if (seenPositions.insert(positionKey(position)).second) {
                report.uniquePositions.push_back(position);
            }
        }

        Logger::debug("Island analysis: " + std::to_string(report.islandIndices.size()) + " island vertices, " +
                      std::to_string(report.uniquePositions.size()) + " unique positions");
        return report;
    }

} // namespace resinslice
