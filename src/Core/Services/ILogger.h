#pragma once
/**
 * @file ILogger.h
 * @brief Logging service interfaces.
 */
#include <stdint.h>
#include <stddef.h>
#include <Arduino.h>

/** @brief Log severity levels. */
enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

static inline const char* logLevelName(LogLevel lvl)
{
    switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    }
    return "?";
}

/** @brief Clamp a persisted level byte to a valid LogLevel. */
static inline LogLevel logLevelFromByte(uint8_t v)
{
    return v > (uint8_t)LogLevel::Error ? LogLevel::Error : (LogLevel)v;
}

// ===== LOG TYPES =====
constexpr int LOG_TAG_MAX = 10;
constexpr int LOG_MSG_MAX = 160;

/** @brief Fixed-size log entry. */
struct LogEntry {
    uint32_t ts_ms;
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Log sink interface. */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
    const char* name;
};

/** @brief Log hub interface (producer side). */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    uint32_t (*dropped)(void* ctx);
    void* ctx;
};

/** @brief Registry interface for log sinks. */
struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    /** @brief Deliver one entry to every sink. */
    void (*dispatch)(void* ctx, const LogEntry& e);
    /** @brief Entries delivered to the sink at index since boot. */
    uint32_t (*written)(void* ctx, int index);
    void* ctx;
};
