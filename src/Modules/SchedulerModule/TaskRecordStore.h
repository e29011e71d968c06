#pragma once
/**
 * @file TaskRecordStore.h
 * @brief Persists the task table as a count plus fixed-size records.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/Storage/IBlobStore.h"
#include "Modules/SchedulerModule/TaskTable.h"

/**
 * @brief Write-through persistence for `TaskTable`.
 *
 * Layout: `ver` (u8 layout version), `cnt` (u8), then `t00`..`tNN` records of
 * `RecordLen` bytes each. Changing the record layout requires bumping
 * `LayoutVersion`; older stores then load as empty.
 *
 * A power loss between the count write and the last record write leaves a
 * store that loads as corrupt (empty table). This is accepted.
 */
class TaskRecordStore {
public:
    static constexpr uint8_t LayoutVersion = 1;
    static constexpr size_t RecordLen =
        Limits::Sched::IdLen + Limits::Sched::TitleLen + 1 + 2 + 2 + 1;

    explicit TaskRecordStore(IBlobStore& store) : store_(store) {}

    /**
     * @brief Overwrite the stored table with `table`.
     *
     * Returns `StorageUnavailable` if the backend is not open and
     * `StorageWriteFailed` if any header or record write fails.
     */
    ErrorCode save(const TaskTable& table);

    /**
     * @brief Replace `out` with the stored table.
     *
     * `out` is empty on any failure: `StorageUnavailable`, `StorageEmpty`
     * (nothing stored yet) or `StorageCorrupt` (version mismatch, bad count,
     * short or invalid record, duplicate ids).
     */
    ErrorCode load(TaskTable& out);

    /** @brief Stale record keys that could not be removed during the last save. */
    uint8_t lastStaleRemoveFailures() const { return staleFailures_; }

    static void encodeRecord(const ScheduleTask& t, uint8_t (&rec)[RecordLen]);
    static bool decodeRecord(const uint8_t (&rec)[RecordLen], ScheduleTask& t);

private:
    static void recordKey_(uint8_t index, char* out, size_t outLen);

    IBlobStore& store_;
    uint8_t staleFailures_ = 0;
};
