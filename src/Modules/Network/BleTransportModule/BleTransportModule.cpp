/**
 * @file BleTransportModule.cpp
 * @brief Implementation file.
 */
#include "BleTransportModule.h"
#include <BLE2902.h>
#include <BLEDevice.h>
#include <BLEServer.h>
#include <BLEUtils.h>
#include <string.h>
#define LOG_TAG "BleTrans"
#include "Core/ModuleLog.h"

namespace {

constexpr const char* ServiceUuid = "6E400001-B5A3-F393-E0A9-E50E24DCCA9E";
constexpr const char* RxCharUuid  = "6E400002-B5A3-F393-E0A9-E50E24DCCA9E";
constexpr const char* TxCharUuid  = "6E400003-B5A3-F393-E0A9-E50E24DCCA9E";

class ServerCallbacks : public BLEServerCallbacks {
public:
    explicit ServerCallbacks(BleTransportModule& owner) : owner_(owner) {}

    void onConnect(BLEServer* server) override {
        (void)server;
        owner_.onLinkUp();
    }
    void onDisconnect(BLEServer* server) override {
        (void)server;
        owner_.onLinkDown();
    }
    void onMtuChanged(BLEServer* server, esp_ble_gatts_cb_param_t* param) override {
        (void)server;
        if (param) owner_.onMtuChanged(param->mtu.mtu);
    }

private:
    BleTransportModule& owner_;
};

class RxCallbacks : public BLECharacteristicCallbacks {
public:
    explicit RxCallbacks(BleTransportModule& owner) : owner_(owner) {}

    void onWrite(BLECharacteristic* characteristic) override {
        owner_.onRxWrite(characteristic->getData(), characteristic->getLength());
    }

private:
    BleTransportModule& owner_;
};

}  // namespace

bool BleTransportModule::postLinkEvent_(TransportEventType type)
{
    TransportEvent ev{};
    ev.type = type;
    ev.len = 0;
    if (!evQ || xQueueSend(evQ, &ev, 0) != pdTRUE) {
        linkLatch_.onLost();
        return false;
    }
    linkLatch_.onQueued();
    return true;
}

void BleTransportModule::onLinkUp()
{
    connected_ = true;
    mtu_ = Limits::Ble::DefaultMtu;
    (void)postLinkEvent_(TransportEventType::Connected);
}

void BleTransportModule::onLinkDown()
{
    connected_ = false;
    mtu_ = Limits::Ble::DefaultMtu;
    (void)postLinkEvent_(TransportEventType::Disconnected);
    // Only one central at a time: advertise again right away.
    startAdvertising_();
}

void BleTransportModule::onMtuChanged(uint16_t mtu)
{
    mtu_ = mtu;
}

void BleTransportModule::onRxWrite(const uint8_t* data, size_t len)
{
    if (!data || len == 0) return;
    if (len >= sizeof(rxScratch_.payload)) {
        oversizeDropCount_.fetch_add(1);
        return;
    }

    rxScratch_.type = TransportEventType::Message;
    rxScratch_.len = (uint16_t)len;
    memcpy(rxScratch_.payload, data, len);
    rxScratch_.payload[len] = '\0';

    if (!evQ || xQueueSend(evQ, &rxScratch_, 0) != pdTRUE) {
        rxDropCount_.fetch_add(1);
    }
}

void BleTransportModule::startAdvertising_()
{
    if (!started_) return;
    BLEAdvertising* adv = BLEDevice::getAdvertising();
    if (adv) adv->start();
}

bool BleTransportModule::svcPoll(void* ctx, TransportEvent* out)
{
    BleTransportModule* self = static_cast<BleTransportModule*>(ctx);
    if (!self || !out || !self->evQ) return false;

    if (xQueueReceive(self->evQ, out, 0) == pdTRUE) return true;

    // Queue drained: replay a link change that could not be queued.
    if (self->linkLatch_.takePending()) {
        out->type = self->connected_ ? TransportEventType::Connected
                                     : TransportEventType::Disconnected;
        out->len = 0;
        out->payload[0] = '\0';
        return true;
    }
    return false;
}

bool BleTransportModule::svcNotify(void* ctx, const char* data, size_t len)
{
    BleTransportModule* self = static_cast<BleTransportModule*>(ctx);
    if (!self || !data || !self->tx_ || !self->connected_) return false;

    self->tx_->setValue((uint8_t*)data, len);
    self->tx_->notify();
    return true;
}

uint16_t BleTransportModule::svcMaxPayload(void* ctx)
{
    BleTransportModule* self = static_cast<BleTransportModule*>(ctx);
    if (!self) return 0;
    const uint16_t mtu = self->mtu_;
    if (mtu <= Limits::Ble::AttHeaderLen) return 0;
    return (uint16_t)(mtu - Limits::Ble::AttHeaderLen);
}

uint32_t BleTransportModule::svcTakeDropped(void* ctx)
{
    BleTransportModule* self = static_cast<BleTransportModule*>(ctx);
    if (!self) return 0;
    return self->rxDropCount_.exchange(0) + self->oversizeDropCount_.exchange(0);
}

void BleTransportModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(nameVar);

    evQ = xQueueCreate(Limits::Ble::EventQueueLen, sizeof(TransportEvent));
    if (!evQ) {
        LOGE("Event queue allocation failed");
        return;
    }

    svc.poll = svcPoll;
    svc.notify = svcNotify;
    svc.maxPayload = svcMaxPayload;
    svc.takeDropped = svcTakeDropped;
    svc.ctx = this;

    if (!services.add("transport", &svc)) {
        LOGE("service registry full, transport service not registered");
        return;
    }
}

void BleTransportModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    (void)services;
    if (!evQ) return;

    if (cfgData.name[0] == '\0') {
        strncpy(cfgData.name, "Morgana-Sched", sizeof(cfgData.name) - 1);
        cfgData.name[sizeof(cfgData.name) - 1] = '\0';
    }

    BLEDevice::init(cfgData.name);
    BLEDevice::setMTU(Limits::Ble::RequestedMtu);

    server_ = BLEDevice::createServer();
    if (!server_) {
        LOGE("BLE server creation failed");
        return;
    }
    static ServerCallbacks serverCb(*this);
    server_->setCallbacks(&serverCb);

    BLEService* service = server_->createService(ServiceUuid);
    if (!service) {
        LOGE("BLE service creation failed");
        return;
    }

    BLECharacteristic* rx = service->createCharacteristic(
        RxCharUuid, BLECharacteristic::PROPERTY_WRITE | BLECharacteristic::PROPERTY_WRITE_NR);
    tx_ = service->createCharacteristic(TxCharUuid, BLECharacteristic::PROPERTY_NOTIFY);
    if (!rx || !tx_) {
        LOGE("BLE characteristic creation failed");
        tx_ = nullptr;
        return;
    }
    tx_->addDescriptor(new BLE2902());

    static RxCallbacks rxCb(*this);
    rx->setCallbacks(&rxCb);

    service->start();

    BLEAdvertising* adv = BLEDevice::getAdvertising();
    adv->addServiceUUID(ServiceUuid);
    adv->setScanResponse(true);
    started_ = true;
    startAdvertising_();

    LOGI("Advertising as '%s' (mtu request=%u)", cfgData.name, (unsigned)Limits::Ble::RequestedMtu);
}
