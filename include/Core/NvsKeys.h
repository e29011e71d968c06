#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS namespaces and keys.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot for ConfigStore (`main.cpp`). */
constexpr char StorageNamespace[] = "morgana"; // Preferences namespace holding ConfigStore-registered variables.

namespace Time {
constexpr char Tz[] = "tm_tz"; // Time module persisted key for field `tz`.
}  // namespace Time

namespace Sched {
constexpr char EvalPeriodMs[] = "sc_evms"; // Scheduler module persisted key for field `eval_ms`.
constexpr char Protocol[] = "sc_proto"; // Scheduler module persisted key for field `proto`.
}  // namespace Sched

namespace Ble {
constexpr char DeviceName[] = "ble_name"; // BLE transport persisted key for field `name`.
}  // namespace Ble

namespace Io {
constexpr char ActiveHigh[] = "io_acth"; // IO module persisted key for field `active_high`.
}  // namespace Io

/** @brief Task records live in their own namespace so a config erase never drops them. */
namespace TaskStore {
constexpr char Namespace[] = "sched"; // Preferences namespace opened by `NvsBlobStore` for task records.
constexpr char Version[] = "ver"; // Record layout version (u8).
constexpr char Count[] = "cnt"; // Number of stored task records (u8).
constexpr char RecordPrefix[] = "t"; // Record keys are `t00`..`t19`.
}  // namespace TaskStore

}  // namespace NvsKeys
