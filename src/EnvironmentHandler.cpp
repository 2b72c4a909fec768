#include "resinslice/EnvironmentHandler.hpp"
#include "resinslice/Logger.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace resinslice {

    namespace {
        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        long long envInteger(const char* name, long long fallback) {
            const char* value = env(name);
            if (!value) {
                return fallback;
            }
            try {
                size_t used = 0;
                long long parsed = std::stoll(value, &used);
                if (used != std::string(value).size()) {
                    throw std::invalid_argument(value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + value);
            }
        }

        double envDouble(const char* name, double fallback) {
            const char* value = env(name);
            if (!value) {
                return fallback;
            }
            try {
                size_t used = 0;
                double parsed = std::stod(value, &used);
                if (used != std::string(value).size()) {
                    throw std::invalid_argument(value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw std::runtime_error(std::string("Invalid number in ") + name + ": " + value);
            }
        }

        std::string envString(const char* name, const std::string& fallback) {
            const char* value = env(name);
            return value ? std::string(value) : fallback;
        }

        int checkedPort(long long value) {
            if (value <= 0 || value > 65535) {
                throw std::runtime_error("Port out of range: " + std::to_string(value));
            }
            return static_cast<int>(value);
        }

        uint32_t checkedDimension(long long value, const char* name) {
            if (value <= 0 || value > static_cast<long long>(UINT32_MAX)) {
                throw std::runtime_error(std::string(name) + " must be a positive 32-bit integer, got " +
                                         std::to_string(value));
            }
            return static_cast<uint32_t>(value);
        }

        std::size_t checkedCount(long long value, const char* name) {
            if (value < 0) {
                throw std::runtime_error(std::string(name) + " must not be negative, got " + std::to_string(value));
            }
            return static_cast<std::size_t>(value);
        }

        long long jsonInteger(const json& config, const char* key, long long fallback) {
            return config.value(key, fallback);
        }
    }

    EnvironmentHandler& EnvironmentHandler::instance() {
        static EnvironmentHandler instance;
        return instance;
    }

    EnvironmentHandler::EnvironmentHandler() {
        reset();
    }

    void EnvironmentHandler::reset() {
        port = 8080;
        configFile.clear();
        imageWidth = 2560;
        imageHeight = 1620;
        sliceThickness = 0.05;
        strategy = "host-parallel";
        workerCount = 0;
        offloadCapacity = 1u << 22;
        platformZ = 0.0;
        logLevel = "info";
    }

    void EnvironmentHandler::init() {
        port = checkedPort(envInteger("RESINSLICE_PORT", port));
        configFile = envString("RESINSLICE_CONFIG_FILE", configFile);

        imageWidth = checkedDimension(envInteger("RESINSLICE_IMAGE_WIDTH", imageWidth), "Image width");
        imageHeight = checkedDimension(envInteger("RESINSLICE_IMAGE_HEIGHT", imageHeight), "Image height");

        sliceThickness = envDouble("RESINSLICE_SLICE_THICKNESS", sliceThickness);
        strategy = envString("RESINSLICE_STRATEGY", strategy);

        workerCount = checkedCount(envInteger("RESINSLICE_WORKERS", static_cast<long long>(workerCount)),
                                   "Worker count");
        offloadCapacity = checkedCount(
                envInteger("RESINSLICE_OFFLOAD_CAPACITY", static_cast<long long>(offloadCapacity)),
                "Offload capacity");

        platformZ = envDouble("RESINSLICE_PLATFORM_Z", platformZ);
        logLevel = envString("RESINSLICE_LOG_LEVEL", logLevel);

        if (!configFile.empty()) {
            std::ifstream file(configFile);
            if (!file) {
                throw std::runtime_error("Unable to open config file: " + configFile);
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            loadJson(buffer.str());
            Logger::info("Loaded configuration overlay from " + configFile);
        }

        validate();
        Logger::setLevel(Logger::parseLevel(logLevel));
    }

    void EnvironmentHandler::loadJson(const std::string& text) {
        // A rejected overlay leaves the current settings unchanged.
        EnvironmentHandler next(*this);
        try {
            json config = json::parse(text);
            if (!config.is_object()) {
                throw std::runtime_error("Configuration must be a JSON object");
            }

            next.port = checkedPort(jsonInteger(config, "port", port));
            next.imageWidth = checkedDimension(jsonInteger(config, "image_width", imageWidth), "Image width");
            next.imageHeight = checkedDimension(jsonInteger(config, "image_height", imageHeight), "Image height");
            next.sliceThickness = config.value("slice_thickness", sliceThickness);
            next.strategy = config.value("strategy", strategy);
            next.workerCount = checkedCount(
                    jsonInteger(config, "workers", static_cast<long long>(workerCount)), "Worker count");
            next.offloadCapacity = checkedCount(
                    jsonInteger(config, "offload_capacity", static_cast<long long>(offloadCapacity)),
                    "Offload capacity");
            next.platformZ = config.value("platform_z", platformZ);
            next.logLevel = config.value("log_level", logLevel);
        } catch (const json::exception& e) {
            throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
        }
        next.validate();
        *this = next;
    }

    void EnvironmentHandler::validate() const {
        if (port <= 0 || port > 65535) {
            throw std::runtime_error("Port out of range: " + std::to_string(port));
        }
        if (imageWidth == 0 || imageHeight == 0) {
            throw std::runtime_error("Image dimensions must be positive");
        }
        if (!std::isfinite(sliceThickness) || sliceThickness <= 0.0) {
            throw std::runtime_error("Slice thickness must be positive");
        }
        if (strategy != "host-parallel" && strategy != "bulk-offload") {
            throw std::runtime_error("Unknown slice strategy: " + strategy);
        }
        if (!std::isfinite(platformZ)) {
            throw std::runtime_error("Platform Z must be finite");
        }
        Logger::parseLevel(logLevel);
    }

    int EnvironmentHandler::getPort() const {
        return port;
    }

    const std::string& EnvironmentHandler::getConfigFile() const {
        return configFile;
    }

    uint32_t EnvironmentHandler::getImageWidth() const {
        return imageWidth;
    }

    uint32_t EnvironmentHandler::getImageHeight() const {
        return imageHeight;
    }

    double EnvironmentHandler::getSliceThickness() const {
        return sliceThickness;
    }

    const std::string& EnvironmentHandler::getStrategy() const {
        return strategy;
    }

    std::size_t EnvironmentHandler::getWorkerCount() const {
        return workerCount;
    }

    std::size_t EnvironmentHandler::getOffloadCapacity() const {
        return offloadCapacity;
    }

    double EnvironmentHandler::getPlatformZ() const {
        return platformZ;
    }

    const std::string& EnvironmentHandler::getLogLevel() const {
        return logLevel;
    }

} // namespace resinslice
