/**
 * @file ScheduleWindow.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/ScheduleWindow.h"
#include <stdio.h>

static bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool scheduleShouldBeOn(const ScheduleTask& task, uint16_t minuteOfDay)
{
    if (!task.active) return false;
    if (task.alwaysOn) return true;

    const uint16_t start = task.startMin;
    const uint16_t end = task.endMin;
    if (start < end) {
        return minuteOfDay >= start && minuteOfDay < end;
    }
    return minuteOfDay >= start || minuteOfDay < end;
}

bool parseClockMinutes(const char* text, uint16_t& outMinutes)
{
    if (!text) return false;

    const char* p = text;
    if (!isDigit(*p)) return false;
    uint16_t hour = (uint16_t)(*p++ - '0');
    if (isDigit(*p)) hour = (uint16_t)(hour * 10 + (*p++ - '0'));
    if (*p++ != ':') return false;
    if (!isDigit(p[0]) || !isDigit(p[1]) || p[2] != '\0') return false;
    const uint16_t minute = (uint16_t)((p[0] - '0') * 10 + (p[1] - '0'));

    if (hour > 23 || minute > 59) return false;
    outMinutes = (uint16_t)(hour * 60 + minute);
    return true;
}

bool formatClockMinutes(uint16_t minutes, char* out, size_t outLen)
{
    if (!out || outLen < 6) return false;
    if (minutes >= Limits::Sched::MinutesPerDay) return false;
    snprintf(out, outLen, "%02u:%02u", (unsigned)(minutes / 60), (unsigned)(minutes % 60));
    return true;
}
