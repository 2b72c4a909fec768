#pragma once

namespace resinslice {

    // Distance under which a vertex counts as lying on a slicing plane, and under
    // which two intersection points of one triangle are merged.
    constexpr double kPlaneEpsilon = 1e-6;

    // Grid pitch used to quantize contour endpoints into integer keys.
    constexpr double kContourEpsilon = 1e-6;

    // Triangles whose edge cross product is shorter than this are dropped on import.
    constexpr float kDegenerateArea = 1e-6f;

    // Vector length below which a normal counts as zero.
    constexpr float kNormalEpsilon = 1e-6f;

    // Tolerance of the build platform height and of horizontal edge detection in the
    // island analyzer.
    constexpr double kIslandEpsilon = 1e-6;

} // namespace resinslice
