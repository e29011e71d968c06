/**
 * @file ScheduleTask.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/ScheduleTask.h"
#include <string.h>

bool scheduleTaskSetId(ScheduleTask& task, const char* src)
{
    if (!src || src[0] == '\0') return false;
    const size_t len = strlen(src);
    if (len >= sizeof(task.id)) return false;
    memcpy(task.id, src, len + 1);
    return true;
}

bool scheduleTaskSetTitle(ScheduleTask& task, const char* src)
{
    if (!src) {
        task.title[0] = '\0';
        return false;
    }
    size_t len = strlen(src);
    const bool truncated = len >= sizeof(task.title);
    if (truncated) {
        len = sizeof(task.title) - 1;
        // Never cut inside a UTF-8 sequence: back up to the lead byte of the split character.
        while (len > 0 && ((uint8_t)src[len] & 0xC0) == 0x80) --len;
    }
    memcpy(task.title, src, len);
    task.title[len] = '\0';
    return truncated;
}

bool scheduleTaskIsValid(const ScheduleTask& task)
{
    if (task.id[0] == '\0') return false;
    if (memchr(task.id, '\0', sizeof(task.id)) == nullptr) return false;
    if (memchr(task.title, '\0', sizeof(task.title)) == nullptr) return false;
    if (task.port > Limits::Sched::MaxPort) return false;
    if (task.startMin >= Limits::Sched::MinutesPerDay) return false;
    if (task.endMin >= Limits::Sched::MinutesPerDay) return false;
    return true;
}

bool scheduleTaskEquals(const ScheduleTask& a, const ScheduleTask& b)
{
    return strcmp(a.id, b.id) == 0 &&
           strcmp(a.title, b.title) == 0 &&
           a.port == b.port &&
           a.startMin == b.startMin &&
           a.endMin == b.endMin &&
           a.active == b.active &&
           a.alwaysOn == b.alwaysOn;
}
