/**
 * @file IOModule.cpp
 * @brief Implementation file.
 */

#include "IOModule.h"
#define LOG_TAG "IOModule"
#include "Core/ModuleLog.h"

void IOModule::onActiveHighChanged(void* ctx, const bool& value)
{
    IOModule* self = static_cast<IOModule*>(ctx);
    self->gpio_.setActiveHigh(value);
    LOGI("Output polarity: %s", value ? "active-high" : "active-low");
}

void IOModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(activeHighVar);
    activeHighVar.addHandler(&IOModule::onActiveHighChanged, this);

    outSvc_.bank = &gpio_;
    if (!services.add("io", &outSvc_)) {
        LOGE("service registry full, io service not registered");
        return;
    }
}

void IOModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    (void)services;

    gpio_.setActiveHigh(cfgData.activeHigh);
    if (!gpio_.begin()) {
        LOGE("Driver %s failed to start", gpio_.id());
        return;
    }
    LOGI("Output bank ready (%s, %s)", gpio_.id(),
         cfgData.activeHigh ? "active-high" : "active-low");
}
