#pragma once
/**
 * @file IOModule.h
 * @brief IO module exposing the GPIO output bank.
 */

#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Modules/IOModule/IODrivers/GpioOutputBank.h"

struct IOModuleConfig {
    bool activeHigh = true;
};

/**
 * @brief Passive module owning the digital outputs driven by the scheduler.
 */
class IOModule : public ModulePassive {
public:
    const char* moduleId() const override { return "io"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "config";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    IOModuleConfig cfgData{};
    GpioOutputBank gpio_{"gpio", true};
    IOOutputService outSvc_{};

    ConfigVariable<bool,1> activeHighVar {
        NVS_KEY(NvsKeys::Io::ActiveHigh),"active_high","io",ConfigType::Bool,
        &cfgData.activeHigh,ConfigPersistence::Persistent,0
    };

    static void onActiveHighChanged(void* ctx, const bool& value);
};
