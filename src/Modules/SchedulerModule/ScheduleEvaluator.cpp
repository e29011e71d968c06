/**
 * @file ScheduleEvaluator.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/ScheduleEvaluator.h"
#include "Modules/SchedulerModule/ScheduleWindow.h"

void ScheduleEvaluator::bind(IDigitalOutputBank& out)
{
    out_ = &out;
    revision_ = out.outputRevision();
    forget();
}

void ScheduleEvaluator::forget()
{
    for (uint8_t i = 0; i < PortCount; ++i) last_[i] = Unknown;
}

int8_t ScheduleEvaluator::lastWritten(uint8_t port) const
{
    if (port >= PortCount) return Unknown;
    return last_[port];
}

ScheduleTickResult ScheduleEvaluator::tick(const TaskTable& table, uint16_t minuteOfDay)
{
    ScheduleTickResult res{};
    if (!out_) return res;

    const uint32_t rev = out_->outputRevision();
    if (rev != revision_) {
        forget();
        revision_ = rev;
    }

    int8_t desired[PortCount];
    for (uint8_t i = 0; i < PortCount; ++i) desired[i] = Unknown;

    for (uint8_t i = 0; i < table.size(); ++i) {
        const ScheduleTask& t = table.at(i);
        if (t.port >= PortCount) continue;
        const bool on = scheduleShouldBeOn(t, minuteOfDay);
        if (on || desired[t.port] == Unknown) desired[t.port] = on ? 1 : 0;
    }

    for (uint8_t port = 0; port < PortCount; ++port) {
        if (desired[port] == Unknown) {
            if (last_[port] == 1) {
                if (!out_->write(port, false)) ++res.failures;
                ++res.released;
            }
            last_[port] = Unknown;
            continue;
        }
        if (desired[port] == last_[port]) continue;

        ++res.writes;
        if (!out_->write(port, desired[port] == 1)) ++res.failures;
        // Recorded even on failure so a dead pin is not retried every pass.
        last_[port] = desired[port];
    }

    return res;
}
