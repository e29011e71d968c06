/**
 * @file TimeModule.cpp
 * @brief Implementation file.
 */
#include "TimeModule.h"
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#define LOG_TAG "TimeModl"
#include "Core/ModuleLog.h"

bool TimeModule::svcIsSynced(void* ctx) {
    auto self = static_cast<TimeModule*>(ctx);
    return self && self->synced_;
}

bool TimeModule::svcSetEpoch(void* ctx, uint64_t epochSec) {
    TimeModule* self = static_cast<TimeModule*>(ctx);
    if (!self) return false;

    if (epochSec < Limits::Time::MinValidEpoch) {
        LOGW("Rejected epoch %llu (before 2021-01-01)", (unsigned long long)epochSec);
        return false;
    }

    struct timeval tv{};
    tv.tv_sec = (time_t)epochSec;
    tv.tv_usec = 0;
    if (settimeofday(&tv, nullptr) != 0) {
        LOGE("settimeofday failed");
        return false;
    }

    const bool first = !self->synced_;
    self->synced_ = true;

    char buf[32];
    if (svcFormatLocalTime(self, buf, sizeof(buf))) {
        if (first) LOGI("Clock set: %s", buf);
        else LOGD("Clock updated: %s", buf);
    }
    return true;
}

bool TimeModule::svcMinuteOfDay(void* ctx, uint16_t* out) {
    TimeModule* self = static_cast<TimeModule*>(ctx);
    if (!self || !out || !self->synced_) return false;

    time_t now = time(nullptr);
    struct tm t;
    if (!localtime_r(&now, &t)) return false;

    *out = (uint16_t)(t.tm_hour * 60 + t.tm_min);
    return true;
}

bool TimeModule::svcFormatLocalTime(void* ctx, char* out, size_t len) {
    (void)ctx;
    if (!out || len == 0) return false;

    time_t now = time(nullptr);
    struct tm t;
    if (!localtime_r(&now, &t)) return false;
    snprintf(out, len, "%04d-%02d-%02d %02d:%02d:%02d",
             t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
             t.tm_hour, t.tm_min, t.tm_sec);
    return true;
}

void TimeModule::applyTimezone_() {
    if (cfgData.tz[0] == '\0') {
        LOGW("Empty timezone, falling back to UTC0");
        strncpy(cfgData.tz, "UTC0", sizeof(cfgData.tz) - 1);
        cfgData.tz[sizeof(cfgData.tz) - 1] = '\0';
    }
    setenv("TZ", cfgData.tz, 1);
    tzset();
    LOGI("Timezone: %s", cfgData.tz);
}

void TimeModule::onTzChanged(void* ctx, const char& value) {
    (void)value;
    static_cast<TimeModule*>(ctx)->applyTimezone_();
}

void TimeModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(tzVar);
    tzVar.addHandler(&TimeModule::onTzChanged, this);

    timeSvc.isSynced = svcIsSynced;
    timeSvc.setEpoch = svcSetEpoch;
    timeSvc.minuteOfDay = svcMinuteOfDay;
    timeSvc.formatLocalTime = svcFormatLocalTime;
    timeSvc.ctx = this;

    if (!services.add("time", &timeSvc)) {
        LOGE("service registry full, time service not registered");
        return;
    }
    LOGI("Time service registered");
}

void TimeModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;
    (void)services;
    applyTimezone_();
}
