#pragma once
/**
 * @file ScheduleTask.h
 * @brief One scheduled on/off window bound to an output port.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

struct ScheduleTask {
    char id[Limits::Sched::IdLen] = {0};
    char title[Limits::Sched::TitleLen] = {0};
    uint8_t port = 0;
    uint16_t startMin = 0;   ///< minutes since local midnight, 0..1439
    uint16_t endMin = 0;     ///< exclusive end, 0..1439
    bool active = true;
    bool alwaysOn = false;
};

/** @brief Copy `src` into the task id. Fails (id untouched) if empty or too long. */
bool scheduleTaskSetId(ScheduleTask& task, const char* src);

/** @brief Copy `src` into the task title, truncating. Returns true if truncated. */
bool scheduleTaskSetTitle(ScheduleTask& task, const char* src);

/** @brief Field-wise validity: non-empty id, port and minutes in range. */
bool scheduleTaskIsValid(const ScheduleTask& task);

/** @brief Field-wise equality, including id. */
bool scheduleTaskEquals(const ScheduleTask& a, const ScheduleTask& b);
