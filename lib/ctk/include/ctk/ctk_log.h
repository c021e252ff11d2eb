/**
 * @file ctk_log.h
 * @brief Level-gated diagnostic logging to stderr.
 *
 * The minimum level is read once from the CTK_LOG_LEVEL environment variable
 * (numeric, matching the CTK_LogLevel values) and defaults to WARNING.
 * CTK_SetLogLevel overrides it at runtime.
 */

#pragma once

enum class CTK_LogLevel : int {
    CRITICAL = 50,
    ERROR    = 40,
    WARNING  = 30,
    INFO     = 20,
    DEBUG    = 10,
    NOTSET   = 0
};

CTK_LogLevel CTK_GetLogLevel();
void CTK_SetLogLevel(CTK_LogLevel level);
bool CTK_LogEnabled(CTK_LogLevel level);
const char* CTK_LogLevelName(CTK_LogLevel level);

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
void CTK_LogMessage(CTK_LogLevel level, const char* file, int line,
                    const char* func, const char* format, ...);

#define CTK_LOG(level, format, ...) \
    CTK_LogMessage(level, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#define CTK_LOG_DEBUG(format, ...) CTK_LOG(CTK_LogLevel::DEBUG, format, ##__VA_ARGS__)
#define CTK_LOG_INFO(format, ...)  CTK_LOG(CTK_LogLevel::INFO, format, ##__VA_ARGS__)
#define CTK_LOG_WARN(format, ...)  CTK_LOG(CTK_LogLevel::WARNING, format, ##__VA_ARGS__)
#define CTK_LOG_ERROR(format, ...) CTK_LOG(CTK_LogLevel::ERROR, format, ##__VA_ARGS__)
