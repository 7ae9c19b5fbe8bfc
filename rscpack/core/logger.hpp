#pragma once

#include "config.hpp"

#include <cstdarg>

namespace rscpack::core {

// Routes raylib's TraceLog through a configurable level and an optional file sink.
class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    ~Logger();

private:
    Logger() = default;

    void* file_{nullptr};
    bool callback_installed_{false};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace rscpack::core
