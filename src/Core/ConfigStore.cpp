/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    size_t wrote = 0;
    switch (m.type) {
        case ConfigType::Int32:
            wrote = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr);
            return wrote == sizeof(int32_t);
        case ConfigType::UInt8:
            wrote = _prefs->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
            return wrote == sizeof(uint8_t);
        case ConfigType::Bool:
            wrote = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr);
            return wrote == sizeof(bool);
        case ConfigType::CharArray: {
            const char* v = (const char*)m.valuePtr;
            wrote = _prefs->putString(m.nvsKey, v);
            return wrote == strlen(v);
        }
        default:
            return false;
    }
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey || !_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
            default:
                break;
        }
    }
}

ConfigMeta* ConfigStore::find(const char* module, const char* name, uint16_t* idx)
{
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].module, module) && strEquals(_meta[i].name, name)) {
            if (idx) *idx = i;
            return &_meta[i];
        }
    }
    return nullptr;
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;

        JsonObject mod = doc[m.module];
        if (mod.isNull()) mod = doc.createNestedObject(m.module);

        switch (m.type) {
            case ConfigType::Int32:     mod[m.name] = *(int32_t*)m.valuePtr; break;
            case ConfigType::UInt8:     mod[m.name] = *(uint8_t*)m.valuePtr; break;
            case ConfigType::Bool:      mod[m.name] = *(bool*)m.valuePtr; break;
            case ConfigType::CharArray: mod[m.name] = (const char*)m.valuePtr; break;
        }
    }

    if (doc.overflowed() || measureJson(doc) + 1 > outLen) {
        Log::warn(LOG_TAG_CORE, "toJson: output truncated (len=%u)", (unsigned)outLen);
        out[0] = '\0';
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        return false;
    }

    for (JsonPairConst modPair : doc.as<JsonObjectConst>()) {
        if (!modPair.value().is<JsonObjectConst>()) continue;

        for (JsonPairConst kv : modPair.value().as<JsonObjectConst>()) {
            uint16_t idx = 0;
            ConfigMeta* m = find(modPair.key().c_str(), kv.key().c_str(), &idx);
            if (!m) {
                Log::debug(LOG_TAG_CORE, "applyJson: unknown %s.%s",
                           modPair.key().c_str(), kv.key().c_str());
                continue;
            }

            JsonVariantConst v = kv.value();
            bool changed = false;
            switch (m->type) {
            case ConfigType::Int32: {
                if (!v.is<int32_t>()) break;
                const int32_t nv = v.as<int32_t>();
                if (*(int32_t*)m->valuePtr != nv) { *(int32_t*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::UInt8: {
                if (!v.is<uint8_t>()) break;
                const uint8_t nv = v.as<uint8_t>();
                if (*(uint8_t*)m->valuePtr != nv) { *(uint8_t*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Bool: {
                if (!v.is<bool>()) break;
                const bool nv = v.as<bool>();
                if (*(bool*)m->valuePtr != nv) { *(bool*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::CharArray: {
                if (!v.is<const char*>() || m->size == 0) break;
                const char* s = v.as<const char*>();
                size_t len = strlen(s);
                if (len >= m->size) len = m->size - 1;
                char* dst = (char*)m->valuePtr;
                if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                    memcpy(dst, s, len);
                    dst[len] = '\0';
                    changed = true;
                }
                break;
            }
            }

            if (!changed) continue;
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m->module, m->name);
            if (m->persistence == ConfigPersistence::Persistent && !writePersistent(*m)) {
                Log::warn(LOG_TAG_CORE, "applyJson: NVS write failed for %s", m->nvsKey ? m->nvsKey : "-");
            }
            if (_notify[idx].fn) _notify[idx].fn(_notify[idx].var);
        }
    }
    return true;
}
