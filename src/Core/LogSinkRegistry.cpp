/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"
#include <string.h>

bool LogSinkRegistry::hasName_(const char* name) const
{
    if (!name) return false;
    for (int i = 0; i < n_; ++i) {
        if (sinks_[i].name && strcmp(sinks_[i].name, name) == 0) return true;
    }
    return false;
}

bool LogSinkRegistry::add(LogSinkService sink)
{
    if (!sink.write || n_ >= MAX_SINKS) return false;
    if (hasName_(sink.name)) return false;
    sinks_[n_] = sink;
    written_[n_] = 0;
    ++n_;
    return true;
}

LogSinkService LogSinkRegistry::get(int idx) const
{
    if (idx < 0 || idx >= n_) return LogSinkService{};
    return sinks_[idx];
}

void LogSinkRegistry::dispatch(const LogEntry& e)
{
    for (int i = 0; i < n_; ++i) {
        sinks_[i].write(sinks_[i].ctx, e);
        written_[i]++;
    }
}

uint32_t LogSinkRegistry::written(int idx) const
{
    return (idx < 0 || idx >= n_) ? 0 : written_[idx];
}
