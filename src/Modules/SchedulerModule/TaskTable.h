#pragma once
/**
 * @file TaskTable.h
 * @brief Bounded, insertion-ordered table of schedule tasks keyed by id.
 */

#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/SchedulerModule/ScheduleTask.h"

/**
 * @brief Fixed-capacity task table.
 *
 * Ids are unique at all times. Removal compacts the table so indices stay
 * dense and in insertion order. Every failing operation leaves the table
 * untouched. The object is trivially copyable; callers snapshot it by value
 * when they need a rollback point.
 */
class TaskTable {
public:
    static constexpr uint8_t Capacity = Limits::Sched::MaxTasks;

    /** @brief Append a task. `CapacityExceeded` when full, `DuplicateId` if the id exists. */
    ErrorCode add(const ScheduleTask& task);
    /** @brief Replace every mutable field of the task matching `task.id`. */
    ErrorCode update(const ScheduleTask& task);
    /** @brief Remove the task with this id and shift later entries left. */
    ErrorCode remove(const char* id);

    /**
     * @brief Discard the current contents and install `tasks` in order.
     *
     * Input beyond capacity and entries repeating an earlier id are skipped.
     * @return Number of input entries that were not installed.
     */
    uint8_t replaceAll(const ScheduleTask* tasks, uint8_t count);
    /** @brief Remove every task. */
    void clear() { count_ = 0; }

    /** @brief Index of the task with this id, or -1. */
    int find(const char* id) const;
    /** @brief Task at index `i` (table order). Caller checks `i < size()`. */
    const ScheduleTask& at(uint8_t i) const { return tasks_[i]; }
    uint8_t size() const { return count_; }
    bool full() const { return count_ >= Capacity; }
    bool empty() const { return count_ == 0; }

    /** @brief Same size and same tasks in the same order. */
    bool equals(const TaskTable& other) const;

private:
    ScheduleTask tasks_[Capacity]{};
    uint8_t count_ = 0;
};
