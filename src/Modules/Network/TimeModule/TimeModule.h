#pragma once
/**
 * @file TimeModule.h
 * @brief Wall-clock module: local timezone and peer-provided epoch.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include <time.h>

/** @brief Time configuration values. */
struct TimeConfig {
    char tz[Limits::Time::TzBuf] = "UTC0";
};

/**
 * @brief Passive module owning the system clock.
 *
 * There is no network time source: the clock is set by the connected peer
 * (`time_sync`) through `TimeService::setEpoch`. The RTC keeps counting
 * across BLE disconnects, so the clock stays valid until reboot.
 */
class TimeModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "time"; }

    /** @brief Depends on log hub and config. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "config";
        return nullptr;
    }

    /** @brief Register config and the time service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply the persisted timezone. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    TimeConfig cfgData{};
    TimeService timeSvc{};
    volatile bool synced_ = false;

    ConfigVariable<char,1> tzVar {
        NVS_KEY(NvsKeys::Time::Tz),"tz","time",ConfigType::CharArray,
        (char*)cfgData.tz,ConfigPersistence::Persistent,sizeof(cfgData.tz)
    };

    void applyTimezone_();
    static void onTzChanged(void* ctx, const char& value);

    static bool svcIsSynced(void* ctx);
    static bool svcSetEpoch(void* ctx, uint64_t epochSec);
    static bool svcMinuteOfDay(void* ctx, uint16_t* out);
    static bool svcFormatLocalTime(void* ctx, char* out, size_t len);
};
