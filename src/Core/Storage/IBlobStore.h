#pragma once
/**
 * @file IBlobStore.h
 * @brief Key-addressed byte storage that survives power loss.
 */

#include <stddef.h>
#include <stdint.h>

/**
 * @brief Minimal persistent key/value contract used by record stores.
 *
 * Put operations return false when the value was not fully written.
 */
class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    /** @brief Whether the backing storage was opened successfully. */
    virtual bool isOpen() const = 0;

    virtual bool putU8(const char* key, uint8_t value) = 0;
    /** @brief Read a byte value. Returns false if the key is absent. */
    virtual bool getU8(const char* key, uint8_t& out) = 0;

    virtual bool putBytes(const char* key, const void* data, size_t len) = 0;
    /** @brief Stored length of `key`, 0 if absent. */
    virtual size_t bytesLength(const char* key) = 0;
    /** @brief Copy up to `len` bytes; returns the number copied. */
    virtual size_t getBytes(const char* key, void* out, size_t len) = 0;

    /** @brief Remove `key`. Removing an absent key is not an error. */
    virtual bool remove(const char* key) = 0;
};
