#include "resinslice/LayerRasterizer.hpp"
#include "resinslice/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace resinslice {

    namespace {
        struct Edge {
            double x0;
            double y0;
            double x1;
            double y1;
            int winding;
        };

        struct Crossing {
            double x;
            int winding;

            bool operator<(const Crossing& other) const { return x < other.x; }
        };
    }

    SliceImage::SliceImage(uint32_t width, uint32_t height)
            : width_(width),
              height_(height),
              pixels_(static_cast<std::size_t>(width) * height, kBackground) {}

    std::size_t SliceImage::litPixelCount() const {
        return static_cast<std::size_t>(
                std::count_if(pixels_.begin(), pixels_.end(), [](uint8_t p) { return p != kBackground; }));
    }

    bool SliceImage::operator==(const SliceImage& other) const {
        return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
    }

    RasterMapping RasterMapping::fit(const BoundingBox& bounds, uint32_t width, uint32_t height) {
        if (width == 0 || height == 0) {
            throw InputContractViolation("image dimensions must be positive");
        }
        if (bounds.isInverted()) {
            throw InputContractViolation("inverted bounding box");
        }

        const double inf = std::numeric_limits<double>::infinity();
        const double scaleX = bounds.width() > 0.0 ? width / bounds.width() : inf;
        const double scaleY = bounds.depth() > 0.0 ? height / bounds.depth() : inf;

        RasterMapping mapping;
        mapping.width = width;
        mapping.height = height;
        mapping.scale = std::min(scaleX, scaleY);
        mapping.minX = bounds.min.x;
        mapping.minY = bounds.min.y;

        if (!std::isfinite(mapping.scale) || mapping.scale <= 0.0) {
            throw InputContractViolation("model has no planar extent to map onto the image");
        }
        return mapping;
    }

    void LayerRasterizer::fillSpan(SliceImage& image, uint32_t row, double x0, double x1) {
        // Pixels whose center lies in [x0, x1).
        double left = std::max(std::ceil(x0 - 0.5), 0.0);
        double right = std::min(std::ceil(x1 - 0.5), static_cast<double>(image.width()));

        for (auto col = static_cast<int64_t>(left); col < static_cast<int64_t>(right); ++col) {
            image.set(static_cast<uint32_t>(col), row, SliceImage::kFilled);
        }
    }

    SliceImage LayerRasterizer::rasterize(const std::vector<PolygonLoop>& loops, const RasterMapping& mapping) {
        if (!std::isfinite(mapping.scale) || mapping.scale <= 0.0) {
            throw InputContractViolation("raster mapping scale must be finite and positive");
        }

        SliceImage image(mapping.width, mapping.height);

        std::vector<Edge> edges;
        double top = std::numeric_limits<double>::infinity();
        double bottom = -std::numeric_limits<double>::infinity();
        for (const auto& loop : loops) {
            if (loop.size() < 3) {
                continue;
            }
            for (size_t i = 0, j = loop.size() - 1; i < loop.size(); j = i++) {
                Edge e{mapping.toImageX(loop[j].x), mapping.toImageY(loop[j].y),
                       mapping.toImageX(loop[i].x), mapping.toImageY(loop[i].y), 0};
                if (e.y0 == e.y1) {
                    continue;
                }
                e.winding = e.y1 > e.y0 ? 1 : -1;
                top = std::min(top, std::min(e.y0, e.y1));
                bottom = std::max(bottom, std::max(e.y0, e.y1));
                edges.push_back(e);
            }
        }
        if (edges.empty()) {
            return image;
        }

        const auto firstRow = static_cast<int64_t>(std::max(0.0, std::floor(top)));
        const auto lastRow = static_cast<int64_t>(std::min<double>(mapping.height, std::ceil(bottom)));

        std::vector<Crossing> crossings;
        for (int64_t row = firstRow; row < lastRow; ++row) {
            const double yc = static_cast<double>(row) + 0.5;

            crossings.clear();
            for (const auto& e : edges) {
                // Half-open in y so a vertex shared by two edges is counted once.
                if ((e.y0 <= yc) != (e.y1 <= yc)) {
                    crossings.push_back({e.x0 + (yc - e.y0) * (e.x1 - e.x0) / (e.y1 - e.y0), e.winding});
                }
            }
            std::sort(crossings.begin(), crossings.end());

            int winding = 0;
            double spanStart = 0.0;
            for (const auto& crossing : crossings) {
                const int before = winding;
                winding += crossing.winding;
                if (before == 0 && winding != 0) {
                    spanStart = crossing.x;
                } else if (before != 0 && winding == 0) {
                    fillSpan(image, static_cast<uint32_t>(row), spanStart, crossing.x);
                }
            }
        }

        return image;
    }

} // namespace resinslice
