#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "resinslice/Geometry.hpp"

namespace resinslice {

    // Single channel 8-bit layer mask. Row 0 is the top of the image.
    class SliceImage {
    public:
        static constexpr uint8_t kBackground = 0;
        static constexpr uint8_t kFilled = 255;

        SliceImage() = default;
        SliceImage(uint32_t width, uint32_t height);

        uint32_t width() const { return width_; }
        uint32_t height() const { return height_; }

        uint8_t at(uint32_t x, uint32_t y) const { return pixels_[static_cast<std::size_t>(y) * width_ + x]; }
        void set(uint32_t x, uint32_t y, uint8_t value) { pixels_[static_cast<std::size_t>(y) * width_ + x] = value; }

        const std::vector<uint8_t>& pixels() const { return pixels_; }

        std::size_t litPixelCount() const;

        bool operator==(const SliceImage& other) const;
        bool operator!=(const SliceImage& other) const { return !(*this == other); }

    private:
        uint32_t width_ = 0;
        uint32_t height_ = 0;
        std::vector<uint8_t> pixels_;
    };

    // Model to image affine map: uniform scale, origin at the model bounding box
    // minimum, Y flipped so that model +Y points to the top of the image.
    struct RasterMapping {
        uint32_t width = 0;
        uint32_t height = 0;
        double scale = 1.0;
        double minX = 0.0;
        double minY = 0.0;

        // scale = min(width / modelWidth, height / modelDepth). Throws
        // InputContractViolation when no finite positive scale exists.
        static RasterMapping fit(const BoundingBox& bounds, uint32_t width, uint32_t height);

        double toImageX(double x) const { return (x - minX) * scale; }
        double toImageY(double y) const { return static_cast<double>(height) - (y - minY) * scale; }
    };

    class LayerRasterizer {
    public:
        // Scan-fills all loops of one plane together with the nonzero winding rule,
        // sampling pixel centers. A hole wound against its outline cancels it, while
        // overlapping outlines wound the same way fill their union.
        static SliceImage rasterize(const std::vector<PolygonLoop>& loops, const RasterMapping& mapping);

    private:
        static void fillSpan(SliceImage& image, uint32_t row, double x0, double x1);
    };

} // namespace resinslice
