/**
 * @file SchedulePass.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/SchedulePass.h"

SchedulePassResult runSchedulePass(ScheduleEvaluator& eval,
                                   const TaskTable& table,
                                   const TransportSession& session,
                                   bool clockValid,
                                   uint16_t minuteOfDay)
{
    SchedulePassResult res{};
    if (!eval.isBound() || !session.isTimeSynced() || !clockValid) return res;
    res.ran = true;
    res.tick = eval.tick(table, minuteOfDay);
    return res;
}
