#include "logger.hpp"

#include <cstdio>
#include <ctime>

#include <raylib.h>

namespace rscpack::core {

static Logger* g_logger = nullptr;

namespace {

const char* level_tag(int logLevel) {
    switch (logLevel) {
        case LOG_ALL: return "ALL";
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        case LOG_NONE: return "NONE";
        default: break;
    }
    return "INFO";
}

void write_prefix(FILE* sink, const char* level) {
    char stamp[32] = {0};
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    std::fprintf(sink, "[%s][%s] ", stamp, level);
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    shutdown();
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (file_) {
            SetTraceLogCallback(&Logger::trace_callback);
            callback_installed_ = true;
        } else {
            TraceLog(LOG_WARNING, "[log] Cannot open log file %s, logging to console only", cfg.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    callback_installed_ = false;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    const char* level_str = level_tag(logLevel);

    FILE* sink = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr;
    if (sink) {
        va_list args_copy;
        va_copy(args_copy, args);

        write_prefix(sink, level_str);
        std::vfprintf(sink, text, args);
        std::fputc('\n', sink);
        std::fflush(sink);

        write_prefix(stderr, level_str);
        std::vfprintf(stderr, text, args_copy);
        std::fputc('\n', stderr);

        va_end(args_copy);
    } else {
        write_prefix(stderr, level_str);
        std::vfprintf(stderr, text, args);
        std::fputc('\n', stderr);
    }
}

} // namespace rscpack::core
