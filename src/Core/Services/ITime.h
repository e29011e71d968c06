#pragma once
/**
 * @file ITime.h
 * @brief Wall-clock service interface.
 */
#include <stddef.h>
#include <stdint.h>

/** @brief Service interface for the system clock and local time. */
struct TimeService {
    /** @brief True once the clock has been set to a plausible epoch since boot. */
    bool (*isSynced)(void* ctx);
    /** @brief Set the system clock. Rejects epochs before `Limits::Time::MinValidEpoch`. */
    bool (*setEpoch)(void* ctx, uint64_t epochSec);
    /** @brief Minutes since local midnight (0..1439). False while the clock is not set. */
    bool (*minuteOfDay)(void* ctx, uint16_t* out);
    bool (*formatLocalTime)(void* ctx, char* out, size_t len);
    void* ctx;
};
