#pragma once
/**
 * @file GpioOutputBank.h
 * @brief ESP32 GPIO output bank addressed by GPIO number.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/IOModule/IODrivers/IODriver.h"

class GpioOutputBank : public IDigitalOutputBank {
public:
    GpioOutputBank(const char* driverId, bool activeHigh);

    const char* id() const override { return driverId_; }
    bool begin() override;

    bool write(uint8_t port, bool on) override;
    bool isWritable(uint8_t port) const override;

    /** @brief Change polarity. Bumps the output revision so callers re-drive their ports. */
    void setActiveHigh(bool activeHigh);
    bool activeHigh() const { return activeHigh_; }
    uint32_t outputRevision() const override { return revision_; }

private:
    static constexpr uint8_t PortCount = Limits::Sched::MaxPort + 1;

    const char* driverId_ = nullptr;
    bool activeHigh_ = true;
    uint32_t revision_ = 0;
    bool configured_[PortCount] = {false};
};
