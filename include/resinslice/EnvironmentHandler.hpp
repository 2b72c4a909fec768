#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace resinslice {

    class EnvironmentHandler {
    public:
        static EnvironmentHandler& instance();

        // Reads RESINSLICE_* variables, then overlays RESINSLICE_CONFIG_FILE (JSON) when
        // set. Throws std::runtime_error on malformed values.
        void init();

        // Overlays settings from a JSON document, same keys as the config file.
        void loadJson(const std::string& text);

        // Restores built-in defaults.
        void reset();

        int getPort() const;
        const std::string& getConfigFile() const;
        uint32_t getImageWidth() const;
        uint32_t getImageHeight() const;
        double getSliceThickness() const;
        const std::string& getStrategy() const;
        std::size_t getWorkerCount() const;
        std::size_t getOffloadCapacity() const;
        double getPlatformZ() const;
        const std::string& getLogLevel() const;

    private:
        EnvironmentHandler();

        void validate() const;

        int port;
        std::string configFile;
        uint32_t imageWidth;
        uint32_t imageHeight;
        double sliceThickness;
        std::string strategy;
        std::size_t workerCount;
        std::size_t offloadCapacity;
        double platformZ;
        std::string logLevel;
    };

} // namespace resinslice
