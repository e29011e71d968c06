#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Queue-based log hub: many producers, one dispatcher task.
 */
class LogHub {
public:
    /** @brief Create the log queue. Returns false if the allocation failed. */
    bool init(uint8_t queueLen);

    /** @brief Enqueue a log entry (non-blocking, drops when full). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

private:
    QueueHandle_t q = nullptr;
};
