#pragma once
/**
 * @file ScheduleEvaluator.h
 * @brief Edge-triggered port driver for the task table.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/IOModule/IODrivers/IODriver.h"
#include "Modules/SchedulerModule/TaskTable.h"

/** @brief Counters from one evaluation pass. */
struct ScheduleTickResult {
    uint8_t writes = 0;     ///< ports whose state changed this pass
    uint8_t failures = 0;   ///< of those, writes refused by the output bank
    uint8_t released = 0;   ///< ports driven off because no task targets them anymore
};

/**
 * @brief Computes the desired state of every referenced port and writes
 * only the ports whose state differs from the last one written.
 *
 * Tasks sharing a port are OR-combined: the port is on when any of them
 * wants it on. A port that was left on and is no longer referenced by any
 * task is driven off once, then forgotten. When the bank reports a new
 * output revision (polarity change) every referenced port is rewritten.
 */
class ScheduleEvaluator {
public:
    ScheduleEvaluator() { forget(); }
    explicit ScheduleEvaluator(IDigitalOutputBank& out) { bind(out); }

    /** @brief Attach the output bank; clears the last-written cache. */
    void bind(IDigitalOutputBank& out);
    bool isBound() const { return out_ != nullptr; }

    /** @brief Run one pass against `table` at `minuteOfDay` (0..1439). No-op when unbound. */
    ScheduleTickResult tick(const TaskTable& table, uint16_t minuteOfDay);

    /** @brief Drop the last-written cache so the next pass rewrites every port. */
    void forget();

    /** @brief Last state written to `port`: 1 on, 0 off, -1 never written. */
    int8_t lastWritten(uint8_t port) const;

private:
    static constexpr int8_t Unknown = -1;
    static constexpr uint8_t PortCount = Limits::Sched::MaxPort + 1;

    IDigitalOutputBank* out_ = nullptr;
    uint32_t revision_ = 0;
    int8_t last_[PortCount];
};
