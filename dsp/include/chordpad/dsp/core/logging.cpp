// ==============================================================================
// Logging Implementation
// ==============================================================================

#include "logging.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace Chordpad {
namespace DSP {

namespace {

std::atomic<LogLevel> gLogLevel{LogLevel::Info};

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& activeSink() {
    static LogSink sink;
    return sink;
}

void writeToStderr(LogLevel level, const char* message) {
    std::fprintf(stderr, "[chordpad] %s %s\n", logLevelName(level), message);
}

} // anonymous namespace

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    activeSink() = std::move(sink);
}

void setLogLevel(LogLevel level) noexcept {
    gLogLevel.store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() noexcept {
    return gLogLevel.load(std::memory_order_relaxed);
}

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

void logMessage(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Off || level < getLogLevel()) {
        return;
    }

    char buf[kMaxLogMessageLength];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(sinkMutex());
    if (activeSink()) {
        activeSink()(level, buf);
    } else {
        writeToStderr(level, buf);
    }
}

} // namespace DSP
} // namespace Chordpad
