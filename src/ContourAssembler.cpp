#include "resinslice/ContourAssembler.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Tolerances.hpp"
#include <cmath>
#include <map>
#include <set>

namespace resinslice {

    namespace {
        using Key = ContourAssembler::Key;
        using Edge = std::pair<Key, Key>;
    }

    AssemblyStats& AssemblyStats::operator+=(const AssemblyStats& other) {
        segments += other.segments;
        collapsedSegments += other.collapsedSegments;
        openChains += other.openChains;
        ambiguousVertices += other.ambiguousVertices;
        return *this;
    }

    ContourAssembler::Key ContourAssembler::quantize(const Vec3& p) {
        const double scale = 1.0 / kContourEpsilon;
        return {static_cast<int64_t>(std::llround(p.x * scale)),
                static_cast<int64_t>(std::llround(p.y * scale))};
    }

    AssemblyResult ContourAssembler::assemble(const std::vector<Segment>& segments) {
        AssemblyResult result;
        result.stats.segments = segments.size();

        std::map<Key, Vec3> pointCoords;
        // Outgoing edges per point, in input order.
        std::map<Key, std::vector<Key>> adjacency;

        for (const auto& segment : segments) {
            const Key startKey = quantize(segment.a);
            const Key endKey = quantize(segment.b);
            if (startKey == endKey) {
                ++result.stats.collapsedSegments;
                continue;
            }

            pointCoords.emplace(startKey, segment.a);
            pointCoords.emplace(endKey, segment.b);

            adjacency[startKey].push_back(endKey);
        }

        for (const auto& node : adjacency) {
            if (node.second.size() > 1) {
                ++result.stats.ambiguousVertices;
            }
        }
        if (result.stats.ambiguousVertices > 0) {
            Logger::debug("Contour assembly: " + std::to_string(result.stats.ambiguousVertices) +
                          " points with more than one outgoing segment");
        }

        std::set<Edge> visitedEdges;

        for (const auto& node : adjacency) {
            const Key& startKey = node.first;

            for (const Key& nextKey : node.second) {
                if (!visitedEdges.insert(Edge(startKey, nextKey)).second) {
                    continue;
                }

                std::vector<Key> loopKeys{startKey};
                Key currentKey = nextKey;

                while (currentKey != startKey) {
                    loopKeys.push_back(currentKey);
                    const Key& previousKey = loopKeys[loopKeys.size() - 2];

                    auto outgoing = adjacency.find(currentKey);
                    if (outgoing == adjacency.end()) {
                        break;
                    }

                    bool found = false;
                    for (const Key& neighborKey : outgoing->second) {
                        if (neighborKey == previousKey) {
                            continue;
                        }
                        if (visitedEdges.insert(Edge(currentKey, neighborKey)).second) {
                            currentKey = neighborKey;
                            found = true;
                            break;
                        }
                    }
                    if (!found) {
                        break;
                    }
                }

                if (loopKeys.size() >= 3 && currentKey == startKey) {
                    PolygonLoop loop;
                    loop.reserve(loopKeys.size());
                    for (const Key& key : loopKeys) {
                        loop.push_back(pointCoords.at(key));
                    }
                    result.loops.push_back(std::move(loop));
                } else {
                    ++result.stats.openChains;
                }
            }
        }

        return result;
    }

} // namespace resinslice
