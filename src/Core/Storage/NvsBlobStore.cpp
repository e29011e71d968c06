/**
 * @file NvsBlobStore.cpp
 * @brief Implementation file.
 */

#include "Core/Storage/NvsBlobStore.h"
#include "Core/Log.h"

#define LOG_TAG_CORE "NvsBlobS"

bool NvsBlobStore::begin(const char* ns)
{
    open_ = prefs_.begin(ns, false);
    if (!open_) {
        Log::error(LOG_TAG_CORE, "cannot open NVS namespace '%s'", ns ? ns : "-");
    }
    return open_;
}

bool NvsBlobStore::putU8(const char* key, uint8_t value)
{
    if (!open_ || !key) return false;
    return prefs_.putUChar(key, value) == sizeof(uint8_t);
}

bool NvsBlobStore::getU8(const char* key, uint8_t& out)
{
    if (!open_ || !key) return false;
    if (!prefs_.isKey(key)) return false;
    out = prefs_.getUChar(key, 0);
    return true;
}

bool NvsBlobStore::putBytes(const char* key, const void* data, size_t len)
{
    if (!open_ || !key || !data || len == 0) return false;
    return prefs_.putBytes(key, data, len) == len;
}

size_t NvsBlobStore::bytesLength(const char* key)
{
    if (!open_ || !key) return 0;
    if (!prefs_.isKey(key)) return 0;
    return prefs_.getBytesLength(key);
}

size_t NvsBlobStore::getBytes(const char* key, void* out, size_t len)
{
    if (!open_ || !key || !out || len == 0) return 0;
    return prefs_.getBytes(key, out, len);
}

bool NvsBlobStore::remove(const char* key)
{
    if (!open_ || !key) return false;
    if (!prefs_.isKey(key)) return true;
    return prefs_.remove(key);
}
