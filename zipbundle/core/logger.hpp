#pragma once

#include "config.hpp"

#include <atomic>
#include <cstdarg>
#include <string>

namespace zipbundle::core {

// Short level label used in log lines ("WARN", "ERROR", ...).
const char* log_level_name(int logLevel);

// One log line without the newline: "[<seconds>][<LEVEL>] <message>".
std::string format_log_line(int logLevel, double seconds, const std::string& message);

// Owns raylib's TraceLog output for the tools.
//
// Messages carry a bracketed subsystem tag by convention ("[bundle] ...",
// "[pack_zip] ..."). Every line at or above the configured level goes to the
// log file (if any) and, unless console output is off, to stderr. Warnings
// and errors are counted so a tool can report them when it exits.
class Logger {
public:
    static Logger& instance();

    // Applies logging settings and resets the counters.
    // @return false if the configured log file could not be opened; stderr
    //         output still works in that case.
    bool init(const LoggingConfig& cfg);

    // Flushes and closes the log file and restores raylib's default output.
    void shutdown();

    // Counts since the last init().
    int warning_count() const { return warnings_.load(); }
    int error_count() const { return errors_.load(); }

    // Path of the open log file, empty when logging to stderr only.
    const std::string& file_path() const { return filePath_; }

private:
    Logger() = default;

    void write_line(int logLevel, const std::string& message);

    void* file_{nullptr};
    std::string filePath_{};
    bool console_{true};
    bool callback_installed_{false};

    std::atomic<int> warnings_{0};
    std::atomic<int> errors_{0};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace zipbundle::core
