#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for `ConfigStore::applyJson` root document. */
constexpr size_t JsonConfigApplyBuf = 1024;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 32;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;

/** @brief Schedule table capacities and wire sizes. */
namespace Sched {

/** @brief Maximum number of tasks held by `TaskTable`. */
constexpr uint8_t MaxTasks = 20;
/** @brief Task id buffer length (36-char UUID plus margin, null included). */
constexpr size_t IdLen = 40;
/** @brief Task title buffer length (null included). Longer titles are truncated. */
constexpr size_t TitleLen = 32;
/** @brief Highest output port number accepted from the client. */
constexpr uint8_t MaxPort = 48;
/** @brief Minutes in one day; valid minute-of-day values are `0..MinutesPerDay-1`. */
constexpr uint16_t MinutesPerDay = 1440;
/** @brief Snapshot record bytes outside id and title: keys, quotes, port 48, "HH:MM" x2, `false` x2, braces. */
constexpr size_t SnapshotRecordFixed = 92;
/** @brief Worst-case snapshot record: every id/title byte escaped to two characters, plus the separating comma. */
constexpr size_t SnapshotRecordMax = SnapshotRecordFixed + 2 * (IdLen - 1) + 2 * (TitleLen - 1) + 1;
/** @brief Encoded snapshot text buffer length used by `SchedulerModule` (brackets and null included). */
constexpr size_t SnapshotBuf = 2 + MaxTasks * SnapshotRecordMax + 1;
/** @brief Serialized `set_config` patch buffer length carried by `ScheduleCommand`. */
constexpr size_t ConfigPatchBuf = 256;

/** @brief Scheduler task sizing. */
constexpr uint16_t TaskStackSize = 8192;
/** @brief Maximum transport events drained per `SchedulerModule::loop` pass. */
constexpr uint8_t MaxEventsPerLoop = 4;

namespace Defaults {
/** @brief Default evaluation period in ms for `sched.eval_ms`. */
constexpr int32_t EvalPeriodMs = 1000;
/** @brief Lower clamp for `sched.eval_ms`. */
constexpr int32_t EvalPeriodMinMs = 100;
/** @brief Upper clamp for `sched.eval_ms`. */
constexpr int32_t EvalPeriodMaxMs = 5000;
}  // namespace Defaults

}  // namespace Sched

/** @brief BLE transport buffers and queue sizes. */
namespace Ble {

/** @brief MTU requested from the peer by `BleTransportModule`. */
constexpr uint16_t RequestedMtu = 517;
/** @brief Default ATT MTU before negotiation. */
constexpr uint16_t DefaultMtu = 23;
/** @brief ATT notification header overhead (opcode + handle). */
constexpr uint16_t AttHeaderLen = 3;
/** @brief Inbound message buffer inside `TransportEvent` (null included). */
constexpr size_t RxPayload = 512;
/** @brief FreeRTOS queue length for transport events. */
constexpr uint8_t EventQueueLen = 6;
/** @brief BLE device name buffer length for `ble.name`. */
constexpr size_t DeviceName = 24;

}  // namespace Ble

/** @brief Time source limits. */
namespace Time {
/** @brief Epoch below which the system clock is considered never set (2021-01-01). */
constexpr uint64_t MinValidEpoch = 1609459200ULL;
/** @brief POSIX TZ string buffer length for `time.tz`. */
constexpr size_t TzBuf = 64;
}  // namespace Time

}  // namespace Limits
