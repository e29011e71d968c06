#pragma once
/**
 * @file ScheduleEngine.h
 * @brief Applies table mutations with write-through persistence.
 */

#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Modules/SchedulerModule/TaskRecordStore.h"
#include "Modules/SchedulerModule/TaskTable.h"

/**
 * @brief Owns the mutate-then-persist sequence for one `TaskTable`.
 *
 * A rejected mutation never reaches the store. If the store write fails
 * after a successful mutation, the table is restored to its previous
 * content so memory and storage never diverge. `Ok` is the only result
 * after which the caller should publish a snapshot.
 */
class ScheduleEngine {
public:
    ScheduleEngine(TaskTable& table, TaskRecordStore& store) : table_(table), store_(store) {}

    ErrorCode load() { return store_.load(table_); }

    ErrorCode addTask(const ScheduleTask& task);
    ErrorCode updateTask(const ScheduleTask& task);
    ErrorCode deleteTask(const char* id);
    /** @brief Full replace. `dropped` receives entries skipped for capacity or duplicate ids. */
    ErrorCode replaceAll(const ScheduleTask* tasks, uint8_t count, uint8_t& dropped);

    const TaskTable& table() const { return table_; }

private:
    ErrorCode commit_(ErrorCode mutation);

    TaskTable& table_;
    TaskRecordStore& store_;
    TaskTable backup_;
};
