/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <Arduino.h>

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// The hub object is reachable through the service ctx.
    if (!hubSvc || !hubSvc->ctx || !_sinkReg) {
        Serial.println("[LOG][ERR] dispatcher: loghub/logsinks service missing");
        return;
    }
    _hub = static_cast<LogHub*>(hubSvc->ctx);
}

void LogDispatcherModule::loop() {
    if (!_hub || !_sinkReg) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    LogEntry e;
    if (!_hub->dequeue(e, pdMS_TO_TICKS(1000))) return;

    const int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }
}
