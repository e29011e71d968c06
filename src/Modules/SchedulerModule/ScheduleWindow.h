#pragma once
/**
 * @file ScheduleWindow.h
 * @brief Time-of-day window arithmetic for schedule tasks.
 */

#include <stddef.h>
#include <stdint.h>
#include "Modules/SchedulerModule/ScheduleTask.h"

/**
 * @brief Whether a task wants its port on at `minuteOfDay`.
 *
 * Disabled tasks are always off, even when flagged always-on. A window with
 * `start < end` covers `[start, end)`. Any other window (including
 * `start == end`) wraps past midnight and covers `[start, 1440) + [0, end)`.
 */
bool scheduleShouldBeOn(const ScheduleTask& task, uint16_t minuteOfDay);

/** @brief Parse "H:MM" or "HH:MM" (00:00..23:59) into minutes since midnight. */
bool parseClockMinutes(const char* text, uint16_t& outMinutes);

/** @brief Format minutes since midnight as "HH:MM". `outLen` must be at least 6. */
bool formatClockMinutes(uint16_t minutes, char* out, size_t outLen);
