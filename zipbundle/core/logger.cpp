#include "logger.hpp"

#include <chrono>
#include <cstdio>
#include <vector>

#include <raylib.h>

namespace zipbundle::core {

static Logger* g_logger = nullptr;

// Seconds since the logger was first used. raylib's GetTime() needs an
// initialized window, which command line tools never open.
static double elapsed_seconds() {
    static const auto start = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

const char* log_level_name(int logLevel) {
    switch (logLevel) {
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        default: break;
    }
    return "INFO";
}

std::string format_log_line(int logLevel, double seconds, const std::string& message) {
    char prefix[48];
    std::snprintf(prefix, sizeof(prefix), "[%.3f][%s] ", seconds, log_level_name(logLevel));
    return prefix + message;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

bool Logger::init(const LoggingConfig& cfg) {
    shutdown();

    g_logger = this;
    warnings_ = 0;
    errors_ = 0;

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return true;
    }

    SetTraceLogLevel(cfg.level);
    elapsed_seconds();

    console_ = cfg.console;
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;

    if (cfg.file.empty()) {
        return true;
    }

    file_ = std::fopen(cfg.file.c_str(), "a");
    if (!file_) {
        TraceLog(LOG_WARNING, "[logger] cannot open log file %s, logging to stderr only", cfg.file.c_str());
        return false;
    }
    filePath_ = cfg.file;
    return true;
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
        callback_installed_ = false;
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }
    filePath_.clear();
}

void Logger::write_line(int logLevel, const std::string& message) {
    if (logLevel == LOG_WARNING) {
        ++warnings_;
    } else if (logLevel >= LOG_ERROR) {
        ++errors_;
    }

    const std::string line = format_log_line(logLevel, elapsed_seconds(), message);

    if (file_) {
        FILE* sink = static_cast<FILE*>(file_);
        std::fputs(line.c_str(), sink);
        std::fputc('\n', sink);
        std::fflush(sink);
    }
    if (console_) {
        std::fputs(line.c_str(), stderr);
        std::fputc('\n', stderr);
    }
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    if (!g_logger) {
        return;
    }

    va_list args_copy;
    va_copy(args_copy, args);
    const int length = std::vsnprintf(nullptr, 0, text, args_copy);
    va_end(args_copy);

    if (length < 0) {
        g_logger->write_line(logLevel, text);
        return;
    }

    std::vector<char> buffer(static_cast<std::size_t>(length) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), text, args);
    g_logger->write_line(logLevel, std::string(buffer.data(), static_cast<std::size_t>(length)));
}

} // namespace zipbundle::core
