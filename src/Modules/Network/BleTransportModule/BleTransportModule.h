#pragma once
/**
 * @file BleTransportModule.h
 * @brief BLE GATT server carrying one JSON message per characteristic write.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Modules/Network/BleTransportModule/TransportSession.h"
#include <atomic>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

class BLEServer;
class BLECharacteristic;

/** @brief BLE transport configuration values. */
struct BleTransportConfig {
    char name[Limits::Ble::DeviceName] = "Morgana-Sched";
};

/**
 * @brief Passive module exposing a Nordic-UART style service.
 *
 * BLE callbacks run in the Bluedroid task: they only copy into a fixed-size
 * `TransportEvent` and post it to a queue without blocking. The consumer
 * drains that queue through `TransportService::poll` from its own task.
 */
class BleTransportModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "transport"; }

    /** @brief Depends on log hub and config. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "config";
        return nullptr;
    }

    /** @brief Register config, create the event queue and the service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Start the GATT server and advertising with the configured name. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /// Called from BLE callbacks (Bluedroid task).
    void onLinkUp();
    void onLinkDown();
    void onMtuChanged(uint16_t mtu);
    void onRxWrite(const uint8_t* data, size_t len);

private:
    BleTransportConfig cfgData{};
    TransportService svc{};

    QueueHandle_t evQ = nullptr;
    BLEServer* server_ = nullptr;
    BLECharacteristic* tx_ = nullptr;
    bool started_ = false;

    volatile bool connected_ = false;
    volatile uint16_t mtu_ = Limits::Ble::DefaultMtu;
    /// Lost link events; `poll` replays the current link state.
    LinkEventLatch linkLatch_;

    std::atomic<uint32_t> rxDropCount_{0};
    std::atomic<uint32_t> oversizeDropCount_{0};

    TransportEvent rxScratch_{};

    ConfigVariable<char,0> nameVar {
        NVS_KEY(NvsKeys::Ble::DeviceName),"name","ble",ConfigType::CharArray,
        (char*)cfgData.name,ConfigPersistence::Persistent,sizeof(cfgData.name)
    };

    bool postLinkEvent_(TransportEventType type);
    void startAdvertising_();

    static bool svcPoll(void* ctx, TransportEvent* out);
    static bool svcNotify(void* ctx, const char* data, size_t len);
    static uint16_t svcMaxPayload(void* ctx);
    static uint32_t svcTakeDropped(void* ctx);
};
