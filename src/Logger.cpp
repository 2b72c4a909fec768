#include "resinslice/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace resinslice {

    namespace {
        std::atomic<int> minimumLevel{static_cast<int>(LogLevel::Info)};
        std::mutex outputMutex;

        // Uses the shared std::localtime buffer; call with outputMutex held.
        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto in_time = std::chrono::system_clock::to_time_t(now);
            std::ostringstream ss;
            ss << std::put_time(std::localtime(&in_time), "%Y-%m-%d %H:%M:%S");
            return ss.str();
        }

        void log(LogLevel level, const char* tag, const std::string& message) {
            if (static_cast<int>(level) < minimumLevel.load()) {
                return;
            }
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cerr << "[" << timestamp() << "] [" << tag << "] " << message << std::endl;
        }
    }

    void Logger::debug(const std::string& message) {
        log(LogLevel::Debug, "DEBUG", message);
    }

    void Logger::info(const std::string& message) {
        log(LogLevel::Info, "INFO", message);
    }

    void Logger::warn(const std::string& message) {
        log(LogLevel::Warn, "WARN", message);
    }

    void Logger::error(const std::string& message) {
        log(LogLevel::Error, "ERROR", message);
    }

    void Logger::setLevel(LogLevel level) {
        minimumLevel.store(static_cast<int>(level));
    }

    LogLevel Logger::level() {
        return static_cast<LogLevel>(minimumLevel.load());
    }

    LogLevel Logger::parseLevel(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info") return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warn;
        if (lower == "error") return LogLevel::Error;

        throw std::runtime_error("Unknown log level: " + name);
    }

} // namespace resinslice
