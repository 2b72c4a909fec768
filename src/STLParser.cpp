#include "resinslice/STLParser.hpp"
#include "resinslice/Geometry.hpp"
#include "resinslice/Logger.hpp"
#include "resinslice/Tolerances.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace resinslice {

    namespace {
        constexpr std::size_t kBinaryHeaderSize = 80;
        constexpr std::size_t kBinaryPreambleSize = 84;
        constexpr std::size_t kBinaryRecordSize = 50;

        std::vector<char> readFile(const std::string& path) {
            std::ifstream file(path, std::ios::binary | std::ios::ate);
            if (!file) {
                throw std::runtime_error("Failed to open file: " + path);
            }

            const std::streamoff size = file.tellg();
            if (size < 0) {
                throw std::runtime_error("Failed to get file size: " + path);
            }

            std::vector<char> contents(static_cast<std::size_t>(size));
            file.seekg(0, std::ios::beg);
            if (!contents.empty() && !file.read(contents.data(), size)) {
                throw std::runtime_error("Failed to read file: " + path);
            }
            return contents;
        }

        bool isFiniteTriangle(const Triangle& tri) {
            for (int v = 0; v < 3; ++v) {
                const float* p = tri.vertex(v);
                for (int i = 0; i < 3; ++i) {
                    if (!std::isfinite(p[i])) {
                        return false;
                    }
                }
            }
            return true;
        }

        Vec3 corner(const Triangle& tri, int i) {
            const float* p = tri.vertex(i);
            return Vec3(p[0], p[1], p[2]);
        }

        // File normals are advisory. A missing or unusable one is replaced by the
        // winding normal, or +Z for a sliver.
        void repairNormal(Triangle& tri) {
            Vec3 normal(tri.normal[0], tri.normal[1], tri.normal[2]);
            double length = normal.length();
            if (!(std::isfinite(length) && length >= 0.1)) {
                normal = (corner(tri, 1) - corner(tri, 0)).cross(corner(tri, 2) - corner(tri, 0));
                length = normal.length();
                if (length <= kNormalEpsilon) {
                    normal = Vec3(0.0, 0.0, 1.0);
                    length = 1.0;
                }
            }
            normal = normal / length;
            tri.normal[0] = static_cast<float>(normal.x);
            tri.normal[1] = static_cast<float>(normal.y);
            tri.normal[2] = static_cast<float>(normal.z);
        }

        class BinaryStlParser {
        private:
            const uint8_t* data;
            size_t size;

            Triangle readTriangle(size_t offset) const {
                Triangle tri;

                STLTriangleRaw raw;
                std::memcpy(&raw, data + offset, sizeof(STLTriangleRaw));

                std::memcpy(tri.normal, raw.normal, sizeof(tri.normal));
                std::memcpy(tri.vertex1, raw.vertex1, sizeof(tri.vertex1));
                std::memcpy(tri.vertex2, raw.vertex2, sizeof(tri.vertex2));
                std::memcpy(tri.vertex3, raw.vertex3, sizeof(tri.vertex3));
                tri.attributeByteCount = raw.attributeByteCount;

                return tri;
            }

        public:
            BinaryStlParser(const void* fileData, size_t fileSize)
                    : data(static_cast<const uint8_t*>(fileData)), size(fileSize) {}

            std::vector<Triangle> parse() const {
                if (size < kBinaryPreambleSize) {
                    throw std::runtime_error("STL file too small");
                }

                uint32_t numTriangles;
                std::memcpy(&numTriangles, data + kBinaryHeaderSize, sizeof(uint32_t));

                Logger::info("Parsing binary STL with " + std::to_string(numTriangles) + " triangles");

                size_t expectedSize = kBinaryPreambleSize + static_cast<size_t>(numTriangles) * kBinaryRecordSize;
                if (size < expectedSize) {
                    throw std::runtime_error("STL file truncated. Expected " +
                                             std::to_string(expectedSize) + " bytes, got " + std::to_string(size));
                }

                std::vector<Triangle> triangles;
                triangles.reserve(numTriangles);

                for (uint32_t i = 0; i < numTriangles; ++i) {
                    Triangle tri = readTriangle(kBinaryPreambleSize + static_cast<size_t>(i) * kBinaryRecordSize);

                    if (!isFiniteTriangle(tri)) {
                        Logger::warn("Non-finite triangle at index " + std::to_string(i) + ", skipping");
                        continue;
                    }

                    repairNormal(tri);
                    triangles.push_back(tri);
                }

                return triangles;
            }
        };

        class AsciiStlParser {
        private:
            std::istringstream in;
            size_t line = 0;

            bool nextLine(std::istringstream& tokens) {
                std::string text;
                while (std::getline(in, text)) {
                    ++line;
                    if (text.find_first_not_of(" \t\r") == std::string::npos) {
                        continue;
                    }
                    tokens.clear();
                    tokens.str(text);
                    return true;
                }
                return false;
            }

            [[noreturn]] void fail(const std::string& what) const {
                throw std::runtime_error("Malformed ASCII STL at line " + std::to_string(line) + ": " + what);
            }

            void expectKeyword(std::istringstream& tokens, const char* keyword) {
                std::string word;
                if (!(tokens >> word) || word != keyword) {
                    fail(std::string("expected '") + keyword + "'");
                }
            }

            void readFloats(std::istringstream& tokens, float* out) {
                for (int i = 0; i < 3; ++i) {
                    std::string value;
                    if (!(tokens >> value)) {
                        fail("expected three coordinates");
                    }
                    try {
                        out[i] = std::stof(value);
                    } catch (const std::exception&) {
                        // stof rejects "inf"/"nan" spellings some exporters emit; keep them
                        // as non-finite so the triangle gets skipped instead of the file.
                        out[i] = std::numeric_limits<float>::quiet_NaN();
                    }
                }
            }

        public:
            AsciiStlParser(const void* fileData, size_t fileSize)
                    : in(std::string(static_cast<const char*>(fileData), fileSize)) {}

            std::vector<Triangle> parse() {
                std::vector<Triangle> triangles;
                std::istringstream tokens;

                if (!nextLine(tokens)) {
                    fail("empty file");
                }
                expectKeyword(tokens, "solid");

                size_t index = 0;
                while (nextLine(tokens)) {
                    std::string word;
                    tokens >> word;
                    if (word == "endsolid") {
                        // Some exporters concatenate several solids in one file.
                        if (!nextLine(tokens)) {
                            break;
                        }
                        expectKeyword(tokens, "solid");
                        continue;
                    }
                    if (word != "facet") {
                        fail("expected 'facet' or 'endsolid', got '" + word + "'");
                    }

                    Triangle tri;
                    expectKeyword(tokens, "normal");
                    readFloats(tokens, tri.normal);

                    if (!nextLine(tokens)) fail("unexpected end of file");
                    expectKeyword(tokens, "outer");
                    expectKeyword(tokens, "loop");

                    for (int v = 0; v < 3; ++v) {
                        if (!nextLine(tokens)) fail("unexpected end of file");
                        expectKeyword(tokens, "vertex");
                        readFloats(tokens, tri.vertex(v));
                    }

                    if (!nextLine(tokens)) fail("unexpected end of file");
                    expectKeyword(tokens, "endloop");
                    if (!nextLine(tokens)) fail("unexpected end of file");
                    expectKeyword(tokens, "endfacet");

                    if (!isFiniteTriangle(tri)) {
                        Logger::warn("Non-finite triangle at index " + std::to_string(index) + ", skipping");
                    } else {
                        repairNormal(tri);
                        triangles.push_back(tri);
                    }
                    ++index;
                }

                Logger::info("Parsed ASCII STL with " + std::to_string(index) + " facets");
                return triangles;
            }
        };

    } // namespace

    bool STLParser::looksLikeAscii(const void* data, std::size_t size) {
        const char* text = static_cast<const char*>(data);
        size_t start = 0;
        while (start < size && std::isspace(static_cast<unsigned char>(text[start]))) {
            ++start;
        }
        if (size - start < 5 || std::strncmp(text + start, "solid", 5) != 0) {
            return false;
        }

        // Binary headers may also start with "solid"; trust the record count when it
        // matches the file size exactly.
        if (size >= kBinaryPreambleSize) {
            uint32_t count;
            std::memcpy(&count, text + kBinaryHeaderSize, sizeof(uint32_t));
            if (kBinaryPreambleSize + static_cast<size_t>(count) * kBinaryRecordSize == size) {
                return false;
            }
        }

        const size_t window = std::min<size_t>(size, 1024);
        return std::string(text, window).find("facet") != std::string::npos ||
               std::string(text, window).find("endsolid") != std::string::npos;
    }

    std::vector<Triangle> STLParser::parseBuffer(const void* data, std::size_t size) {
        if (data == nullptr || size == 0) {
            throw std::runtime_error("STL file is empty");
        }

        std::vector<Triangle> triangles;
        if (looksLikeAscii(data, size)) {
            AsciiStlParser parser(data, size);
            triangles = parser.parse();
        } else {
            BinaryStlParser parser(data, size);
            triangles = parser.parse();
        }

        Logger::info("Successfully parsed " + std::to_string(triangles.size()) + " valid triangles");
        return triangles;
    }

    std::vector<Triangle> STLParser::parse(const std::string& path) {
        std::vector<char> contents = readFile(path);
        return parseBuffer(contents.data(), contents.size());
    }

} // namespace resinslice
