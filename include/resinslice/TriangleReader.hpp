#pragma once
#include <map>
#include <string>
#include <vector>
#include "resinslice/STLParser.hpp"

namespace resinslice {

    // Anything that can hand out a triangle soup for a named source.
    class TriangleReader {
    public:
        virtual ~TriangleReader() = default;

        virtual std::vector<Triangle> readTriangles(const std::string& source) const = 0;

        // Content hash of a source, stable across runs.
        virtual std::string fingerprint(const std::string& source) const = 0;
    };

    // Reads STL files from disk; the source is a file path.
    class StlTriangleReader : public TriangleReader {
    public:
        std::vector<Triangle> readTriangles(const std::string& source) const override;
        std::string fingerprint(const std::string& source) const override;
    };

    // Serves triangle lists registered under a name. Used by tests and by callers
    // that already hold a parsed model.
    class InMemoryTriangleReader : public TriangleReader {
    public:
        void add(const std::string& source, std::vector<Triangle> triangles);

        std::vector<Triangle> readTriangles(const std::string& source) const override;

        // Hash of the vertex coordinates in STL record order.
        std::string fingerprint(const std::string& source) const override;

    private:
        std::map<std::string, std::vector<Triangle>> sources;
    };

} // namespace resinslice
