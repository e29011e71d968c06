#pragma once
/**
 * @file NvsBlobStore.h
 * @brief IBlobStore backed by an ESP32 Preferences (NVS) namespace.
 */

#include <Preferences.h>
#include "Core/Storage/IBlobStore.h"

class NvsBlobStore : public IBlobStore {
public:
    /** @brief Open `ns` read/write. Keeps the namespace open for the process lifetime. */
    bool begin(const char* ns);

    bool isOpen() const override { return open_; }
    bool putU8(const char* key, uint8_t value) override;
    bool getU8(const char* key, uint8_t& out) override;
    bool putBytes(const char* key, const void* data, size_t len) override;
    size_t bytesLength(const char* key) override;
    size_t getBytes(const char* key, void* out, size_t len) override;
    bool remove(const char* key) override;

private:
    Preferences prefs_;
    bool open_ = false;
};
