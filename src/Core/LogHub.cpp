/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::init(uint8_t queueLen) {
    if (q) return true;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    return xQueueSend(q, &e, 0) == pdTRUE;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}
