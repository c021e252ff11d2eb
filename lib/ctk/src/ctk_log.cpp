/**
 * @file ctk_log.cpp
 * @brief Logging implementation.
 */

#include "ctk/ctk_log.h"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

CTK_LogLevel levelFromEnvironment() {
    const char* env = std::getenv("CTK_LOG_LEVEL");
    if (!env || *env == '\0') {
        return CTK_LogLevel::WARNING;
    }
    char* end = nullptr;
    long value = std::strtol(env, &end, 10);
    if (end == env) {
        return CTK_LogLevel::WARNING;
    }
    if (value < 0) value = 0;
    return static_cast<CTK_LogLevel>(value);
}

std::atomic<int>& minLevel() {
    static std::atomic<int> level(static_cast<int>(levelFromEnvironment()));
    return level;
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
#if defined(_WIN32)
    const char* backslash = std::strrchr(path, '\\');
    if (backslash && (!slash || backslash > slash)) slash = backslash;
#endif
    return slash ? slash + 1 : path;
}

} // namespace

CTK_LogLevel CTK_GetLogLevel() {
    return static_cast<CTK_LogLevel>(minLevel().load());
}

void CTK_SetLogLevel(CTK_LogLevel level) {
    minLevel().store(static_cast<int>(level));
}

bool CTK_LogEnabled(CTK_LogLevel level) {
    return static_cast<int>(level) >= minLevel().load();
}

const char* CTK_LogLevelName(CTK_LogLevel level) {
    switch (level) {
        case CTK_LogLevel::CRITICAL: return "CRITICAL";
        case CTK_LogLevel::ERROR:    return "ERROR";
        case CTK_LogLevel::WARNING:  return "WARNING";
        case CTK_LogLevel::INFO:     return "INFO";
        case CTK_LogLevel::DEBUG:    return "DEBUG";
        default:                     return "NOTSET";
    }
}

void CTK_LogMessage(CTK_LogLevel level, const char* file, int line,
                    const char* func, const char* format, ...) {
    if (!CTK_LogEnabled(level)) {
        return;
    }

    char message[512];
    va_list args;
    va_start(args, format);
    int written = std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);
    if (written < 0) {
        std::fprintf(stderr, "CTK log formatting error at %s:%d\n", baseName(file), line);
        return;
    }

    // One fprintf per line so concurrent writers do not interleave mid-line.
    std::fprintf(stderr, "[%s] %s:%d in %s: %s\n",
                 CTK_LogLevelName(level), baseName(file), line, func, message);
}
