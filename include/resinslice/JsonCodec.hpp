#pragma once
#include <nlohmann/json.hpp>
#include "resinslice/EnvironmentHandler.hpp"
#include "resinslice/SliceService.hpp"

namespace resinslice {

    // Request and response bodies of the HTTP front end.
    //
    // Request:
    //   {
    //     "models": [{"name": "part", "path": "/data/part.stl",
    //                 "position": [x, y, z], "rotation": [rx, ry, rz], "scale": [sx, sy, sz],
    //                 "enabled": true}],
    //     "width": 2560, "height": 1620, "thickness": 0.05,
    //     "bodies": ["part"]
    //   }
    //
    // Everything but "models" and each model's "path" is optional; image size and
    // thickness fall back to the configured defaults.
    class JsonCodec {
    public:
        // Throws InputContractViolation on a malformed request.
        static JobRequest parseJobRequest(const nlohmann::json& body, const EnvironmentHandler& defaults);

        static nlohmann::json toJson(const JobResult& result, bool includeSlices);
        static nlohmann::json toJson(const IslandReport& report);
        static nlohmann::json toJson(const SliceLayer& layer);
        static nlohmann::json toJson(const BoundingBox& box);
    };

} // namespace resinslice
