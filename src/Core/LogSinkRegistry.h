#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of named log sinks.
 */
#include "Core/Services/ILogger.h"

/**
 * @brief Stores registered sinks and fans entries out to them.
 *
 * Sinks are only added during module init; dispatch() runs on the log
 * dispatcher task.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink. Sinks without write callback or with a duplicate name are rejected. */
    bool add(LogSinkService sink);
    int count() const { return n_; }
    /** @brief Sink at index, or an empty sink. */
    LogSinkService get(int idx) const;

    /** @brief Write an entry to every sink. */
    void dispatch(const LogEntry& e);
    /** @brief Entries delivered to the sink at index since boot. */
    uint32_t written(int idx) const;

private:
    static constexpr int MAX_SINKS = 4;
    LogSinkService sinks_[MAX_SINKS]{};
    uint32_t written_[MAX_SINKS]{};
    int n_ = 0;

    bool hasName_(const char* name) const;
};
