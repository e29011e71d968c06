#pragma once
/**
 * @file ScheduleCodec.h
 * @brief JSON wire codec for schedule commands and table snapshots.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/SchedulerModule/ScheduleTask.h"
#include "Modules/SchedulerModule/TaskTable.h"

/**
 * @brief Wire protocol generation.
 *
 * `Incremental` carries per-task add/update/delete with ids and titles.
 * `Legacy` replaces the whole table with id-less records. A running device
 * speaks exactly one of them.
 */
enum class ScheduleProtocol : uint8_t { Legacy = 1, Incremental = 2 };

enum class ScheduleCmdType : uint8_t {
    TimeSync,
    GetSchedules,
    Add,
    Update,
    Delete,
    SetSchedules,
    SetConfig
};

/** @brief One decoded inbound message. Fields not used by `type` are left at defaults. */
struct ScheduleCommand {
    ScheduleCmdType type = ScheduleCmdType::GetSchedules;

    /// `time_sync`, or a legacy message carrying `time`.
    bool hasTime = false;
    uint64_t epochSec = 0;

    /// `add` / `update`.
    ScheduleTask task{};
    bool titleTruncated = false;

    /// `delete`.
    char id[Limits::Sched::IdLen] = {0};

    /// Legacy `set_schedules`.
    ScheduleTask tasks[Limits::Sched::MaxTasks]{};
    uint8_t taskCount = 0;
    uint8_t tasksSkipped = 0;   ///< records beyond table capacity

    /// `set_config`, re-serialized as a ConfigStore patch.
    char configPatch[Limits::Sched::ConfigPatchBuf] = {0};
};

/**
 * @brief Decode one message of `len` bytes.
 *
 * Any failure leaves `out` in an unspecified state and returns a decode
 * error code (see `errorCodeIsDecode`). Not reentrant: the JSON document is
 * shared static storage.
 */
ErrorCode decodeScheduleCommand(const char* json, size_t len, ScheduleProtocol proto,
                                ScheduleCommand& out);

/**
 * @brief Encode the table as one JSON array of
 * `{id,title,port,start,end,active,alwaysOn}` objects in table order.
 *
 * @return Bytes written (without terminator), or 0 when `outLen` is too small.
 */
size_t encodeScheduleSnapshot(const TaskTable& table, char* out, size_t outLen);

/** @brief Receiver-side check: after trimming whitespace the text is `[ ... ]`. */
bool isCompleteSnapshot(const char* text, size_t len);

/** @brief Wire name of a command, for logs. */
const char* scheduleCmdName(ScheduleCmdType type);
