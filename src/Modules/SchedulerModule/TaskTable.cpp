/**
 * @file TaskTable.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/TaskTable.h"
#include <string.h>

int TaskTable::find(const char* id) const
{
    if (!id || id[0] == '\0') return -1;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(tasks_[i].id, id) == 0) return i;
    }
    return -1;
}

ErrorCode TaskTable::add(const ScheduleTask& task)
{
    if (count_ >= Capacity) return ErrorCode::CapacityExceeded;
    if (!scheduleTaskIsValid(task)) return ErrorCode::InvalidTask;
    if (find(task.id) >= 0) return ErrorCode::DuplicateId;

    tasks_[count_++] = task;
    return ErrorCode::Ok;
}

ErrorCode TaskTable::update(const ScheduleTask& task)
{
    const int idx = find(task.id);
    if (idx < 0) return ErrorCode::NotFound;
    if (!scheduleTaskIsValid(task)) return ErrorCode::InvalidTask;

    // id stays as stored; only the mutable fields move.
    ScheduleTask& dst = tasks_[idx];
    memcpy(dst.title, task.title, sizeof(dst.title));
    dst.port = task.port;
    dst.startMin = task.startMin;
    dst.endMin = task.endMin;
    dst.active = task.active;
    dst.alwaysOn = task.alwaysOn;
    return ErrorCode::Ok;
}

ErrorCode TaskTable::remove(const char* id)
{
    const int idx = find(id);
    if (idx < 0) return ErrorCode::NotFound;

    for (uint8_t i = (uint8_t)idx; i + 1 < count_; ++i) {
        tasks_[i] = tasks_[i + 1];
    }
    --count_;
    tasks_[count_] = ScheduleTask{};
    return ErrorCode::Ok;
}

uint8_t TaskTable::replaceAll(const ScheduleTask* tasks, uint8_t count)
{
    count_ = 0;
    if (!tasks) return count;

    uint8_t dropped = 0;
    for (uint8_t i = 0; i < count; ++i) {
        if (add(tasks[i]) != ErrorCode::Ok) ++dropped;
    }
    for (uint8_t i = count_; i < Capacity; ++i) {
        tasks_[i] = ScheduleTask{};
    }
    return dropped;
}

bool TaskTable::equals(const TaskTable& other) const
{
    if (count_ != other.count_) return false;
    for (uint8_t i = 0; i < count_; ++i) {
        if (!scheduleTaskEquals(tasks_[i], other.tasks_[i])) return false;
    }
    return true;
}
