#pragma once

#include <stdint.h>

#ifndef BOARD_REV
#define BOARD_REV 1
#endif

namespace Board {

#if BOARD_REV == 1
// ESP32-WROOM DevKit. 6..11 are wired to the SPI flash, 34..39 are input-only.
constexpr bool isOutputCapable(uint8_t gpio)
{
    if (gpio >= 6 && gpio <= 11) return false;
    if (gpio == 20 || gpio == 24) return false;
    if (gpio >= 28 && gpio <= 31) return false;
    return gpio <= 33;
}
#elif BOARD_REV == 2
// ESP32-S3 DevKitC (octal PSRAM). 26..37 are flash/PSRAM lines.
constexpr bool isOutputCapable(uint8_t gpio)
{
    if (gpio >= 22 && gpio <= 25) return false;
    if (gpio >= 26 && gpio <= 37) return false;
    return gpio <= 48;
}
#else
#error "Unsupported BOARD_REV value"
#endif

}  // namespace Board
