#pragma once
/**
 * @file IODriver.h
 * @brief Base interfaces for IO drivers.
 */

#include <stdint.h>

class IODriver {
public:
    virtual ~IODriver() = default;
    virtual const char* id() const = 0;
    virtual bool begin() = 0;
};

/**
 * @brief Bank of digital outputs addressed by port number.
 *
 * `write` returns false when the port cannot be driven (not an output pin,
 * out of range). A failed write has no side effect on other ports.
 */
class IDigitalOutputBank : public IODriver {
public:
    virtual bool write(uint8_t port, bool on) = 0;
    virtual bool isWritable(uint8_t port) const = 0;
    /** @brief Bumped whenever earlier writes no longer hold the level they asked for (polarity change). */
    virtual uint32_t outputRevision() const { return 0; }
};
