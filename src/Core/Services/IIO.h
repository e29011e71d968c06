#pragma once
/**
 * @file IIO.h
 * @brief I/O service interfaces.
 */
#include <stdint.h>

class IDigitalOutputBank;

/** @brief Digital output bank exposed by IOModule. */
struct IOOutputService {
    IDigitalOutputBank* bank;
};
