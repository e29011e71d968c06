#pragma once
/**
 * @file SchedulePass.h
 * @brief One evaluation pass gated on the peer's time sync.
 */

#include <stdint.h>
#include "Modules/Network/BleTransportModule/TransportSession.h"
#include "Modules/SchedulerModule/ScheduleEvaluator.h"
#include "Modules/SchedulerModule/TaskTable.h"

/** @brief Outcome of `runSchedulePass`. */
struct SchedulePassResult {
    bool ran = false;           ///< false: outputs held (unsynced session, no clock or no bank)
    ScheduleTickResult tick{};
};

/**
 * @brief Evaluate `table` only when the current connection delivered a time
 * value and the local clock answered with `minuteOfDay`.
 *
 * After a reconnect the session is unsynced again, so ports hold their last
 * state until the next time sync even though the clock keeps running.
 */
SchedulePassResult runSchedulePass(ScheduleEvaluator& eval,
                                   const TaskTable& table,
                                   const TransportSession& session,
                                   bool clockValid,
                                   uint16_t minuteOfDay);
