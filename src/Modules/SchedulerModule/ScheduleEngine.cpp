/**
 * @file ScheduleEngine.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/ScheduleEngine.h"

ErrorCode ScheduleEngine::commit_(ErrorCode mutation)
{
    if (mutation != ErrorCode::Ok) return mutation;

    const ErrorCode saved = store_.save(table_);
    if (saved != ErrorCode::Ok) {
        table_ = backup_;
        return saved;
    }
    return ErrorCode::Ok;
}

ErrorCode ScheduleEngine::addTask(const ScheduleTask& task)
{
    backup_ = table_;
    return commit_(table_.add(task));
}

ErrorCode ScheduleEngine::updateTask(const ScheduleTask& task)
{
    backup_ = table_;
    return commit_(table_.update(task));
}

ErrorCode ScheduleEngine::deleteTask(const char* id)
{
    backup_ = table_;
    return commit_(table_.remove(id));
}

ErrorCode ScheduleEngine::replaceAll(const ScheduleTask* tasks, uint8_t count, uint8_t& dropped)
{
    backup_ = table_;
    dropped = table_.replaceAll(tasks, count);
    return commit_(ErrorCode::Ok);
}
