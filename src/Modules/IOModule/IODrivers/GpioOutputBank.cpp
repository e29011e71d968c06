/**
 * @file GpioOutputBank.cpp
 * @brief Implementation file.
 */

#include "GpioOutputBank.h"
#include "Board/BoardPinMap.h"
#include <Arduino.h>

GpioOutputBank::GpioOutputBank(const char* driverId, bool activeHigh)
    : driverId_(driverId), activeHigh_(activeHigh)
{
}

void GpioOutputBank::setActiveHigh(bool activeHigh)
{
    if (activeHigh == activeHigh_) return;
    activeHigh_ = activeHigh;
    ++revision_;
}

bool GpioOutputBank::begin()
{
    // Pins are switched to OUTPUT on first write: boot straps stay untouched
    // until a task actually targets them.
    for (uint8_t i = 0; i < PortCount; ++i) configured_[i] = false;
    return true;
}

bool GpioOutputBank::isWritable(uint8_t port) const
{
    return port < PortCount && Board::isOutputCapable(port);
}

bool GpioOutputBank::write(uint8_t port, bool on)
{
    if (!isWritable(port)) return false;
    if (!configured_[port]) {
        pinMode(port, OUTPUT);
        configured_[port] = true;
    }
    bool level = on ? activeHigh_ : !activeHigh_;
    digitalWrite(port, level ? HIGH : LOW);
    return true;
}
