/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json) {
    return ((ConfigStore*)ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJson(void* ctx, char* out, size_t outLen) {
    return ((ConfigStore*)ctx)->toJson(out, outLen);
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry = &cfg;

    svc.applyJson = svcApplyJson;
    svc.toJson = svcToJson;
    svc.ctx = registry;

    if (!services.add("config", &svc)) {
        LOGE("service registry full, config service not registered");
        return;
    }
    LOGI("ConfigStoreService registered");
}

void ConfigStoreModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) {
    (void)services;
    char buf[256];
    if (cfg.toJson(buf, sizeof(buf))) {
        LOGI("config: %s", buf);
    }
}
