#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// Design goals (ESP32):
// - no heap allocations in normal runtime path
// - variables live in their owning module; the store only keeps metadata
// - change handlers run synchronously in the caller's context

#include <Preferences.h>
#include <cstdint>
#include <cstring>

#include "ConfigTypes.h"
#include "Core/Log.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    void registerVar(ConfigVariable<T, H>& var);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();

    /** @brief Serialize all registered config as `{"module":{"name":value}}`. */
    bool toJson(char* out, size_t outLen) const;
    /**
     * @brief Apply a `{"module":{"name":value}}` patch.
     *
     * Unknown modules/names and values of the wrong JSON type are skipped.
     * Changed values are persisted and their handlers notified.
     * @return false if the text is not a JSON object.
     */
    bool applyJson(const char* json);

private:
    /** @brief Change notification hook captured at registration. */
    struct Notifier {
        void (*fn)(void* var);
        void* var;
    };

    Preferences* _prefs = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS];
    Notifier _notify[MAX_CONFIG_VARS]{};
    uint16_t _metaCount = 0;

    bool writePersistent(const ConfigMeta& m);
    ConfigMeta* find(const char* module, const char* name, uint16_t* idx);

    template<typename T, size_t H>
    static void notifyThunk(void* var) {
        static_cast<ConfigVariable<T, H>*>(var)->notify();
    }
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
void ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::warn(LOG_TAG_CORE, "config table full, %s.%s not registered",
                  var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn(LOG_TAG_CORE, "NVS key too long (%s)", var.nvsKey);
        return;
    }

    _notify[_metaCount] = Notifier{ &ConfigStore::notifyThunk<T, H>, &var };
    ConfigMeta& m = _meta[_metaCount++];

    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
}
