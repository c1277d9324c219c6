// ==============================================================================
// Layer 0: Core Utilities
// logging.h - printf-style Diagnostic Logging
// ==============================================================================
// Messages are formatted into a fixed stack buffer with vsnprintf and handed to
// the active sink. The default sink writes to stderr. Tests install their own
// sink with setLogSink() to capture output.
//
// NOT real-time safe: sinks may perform I/O. Do not log from render paths.
//
// Usage:
//   CHORDPAD_LOG_WARNING("oscillator %zu of note %u failed", slot, note);
// ==============================================================================

#pragma once

#include <cstdint>
#include <functional>

#if defined(__GNUC__) || defined(__clang__)
#define CHORDPAD_PRINTF_FORMAT(fmtIndex, argIndex) \
    __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define CHORDPAD_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace Chordpad {
namespace DSP {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

/// Maximum formatted message length (longer messages are truncated)
inline constexpr int kMaxLogMessageLength = 512;

/// Receives every message at or above the current threshold.
using LogSink = std::function<void(LogLevel level, const char* message)>;

/// Replace the active sink. An empty function restores the stderr sink.
void setLogSink(LogSink sink);

/// Messages below this level are discarded before formatting.
void setLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel getLogLevel() noexcept;

[[nodiscard]] const char* logLevelName(LogLevel level) noexcept;

void logMessage(LogLevel level, const char* fmt, ...) CHORDPAD_PRINTF_FORMAT(2, 3);

} // namespace DSP
} // namespace Chordpad

#define CHORDPAD_LOG_DEBUG(...) \
    ::Chordpad::DSP::logMessage(::Chordpad::DSP::LogLevel::Debug, __VA_ARGS__)
#define CHORDPAD_LOG_INFO(...) \
    ::Chordpad::DSP::logMessage(::Chordpad::DSP::LogLevel::Info, __VA_ARGS__)
#define CHORDPAD_LOG_WARNING(...) \
    ::Chordpad::DSP::logMessage(::Chordpad::DSP::LogLevel::Warning, __VA_ARGS__)
#define CHORDPAD_LOG_ERROR(...) \
    ::Chordpad::DSP::logMessage(::Chordpad::DSP::LogLevel::Error, __VA_ARGS__)
