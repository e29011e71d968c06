#pragma once
/**
 * @file ITransport.h
 * @brief Message transport service interface (one message per write).
 */
#include <stddef.h>
#include <stdint.h>
#include "Core/SystemLimits.h"

/** @brief Kind of event surfaced by a transport. */
enum class TransportEventType : uint8_t { Connected, Disconnected, Message };

/** @brief Fixed-size transport event, copied through a FreeRTOS queue. */
struct TransportEvent {
    TransportEventType type = TransportEventType::Message;
    uint16_t len = 0;
    char payload[Limits::Ble::RxPayload] = {0};   ///< null-terminated for Message
};

/** @brief Service interface exposed by a transport module. */
struct TransportService {
    /** @brief Pop the next pending event without blocking. */
    bool (*poll)(void* ctx, TransportEvent* out);
    /** @brief Send one outbound message to the connected peer. */
    bool (*notify)(void* ctx, const char* data, size_t len);
    /** @brief Largest payload deliverable in one notification. */
    uint16_t (*maxPayload)(void* ctx);
    /** @brief Events lost to a full queue or an oversize write since the last call. */
    uint32_t (*takeDropped)(void* ctx);
    void* ctx;
};
