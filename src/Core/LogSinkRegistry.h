#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"

/**
 * @brief Fixed list of sinks. Filled during init, read by the dispatcher task.
 */
class LogSinkRegistry {
public:
    bool add(LogSinkService sink);
    int count() const { return n; }
    /** @brief Sink at index, or an empty sink when out of range. */
    LogSinkService get(int idx) const;

private:
    static constexpr int MAX_SINKS = 2;
    LogSinkService sinks[MAX_SINKS]{};
    int n = 0;
};
