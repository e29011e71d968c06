#pragma once
/**
 * @file ModulePassive.h
 * @brief Base class for modules without a task of their own.
 */
#include "Core/Module.h"

/**
 * @brief Module that only registers config and services.
 *
 * Its code runs in the caller's context: service calls come from the
 * scheduler task, BLE callbacks from the Bluedroid task.
 */
class ModulePassive : public Module {
public:
    bool hasTask() const override { return false; }
    const char* taskName() const override { return ""; }
    uint32_t loopDelayMs() const override { return 0; }

    void loop() override {}
};
