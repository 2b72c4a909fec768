#pragma once
#include <string>

namespace resinslice {

    enum class LogLevel {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    class Logger {
    public:
        static void debug(const std::string& message);
        static void info(const std::string& message);
        static void warn(const std::string& message);
        static void error(const std::string& message);

        static void setLevel(LogLevel level);
        static LogLevel level();

        // Accepts "debug", "info", "warn" or "error" (case-insensitive).
        static LogLevel parseLevel(const std::string& name);
    };

} // namespace resinslice
