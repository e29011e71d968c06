/**
 * @file SchedulerModule.cpp
 * @brief Implementation file.
 */
#include "SchedulerModule.h"
#include <Arduino.h>
#define LOG_TAG "Schedulr"
#include "Core/ModuleLog.h"

ScheduleProtocol SchedulerModule::protocol_() const
{
    return (cfgData.protocol == (uint8_t)ScheduleProtocol::Legacy)
        ? ScheduleProtocol::Legacy
        : ScheduleProtocol::Incremental;
}

uint32_t SchedulerModule::evalPeriodMs_() const
{
    int32_t ms = cfgData.evalPeriodMs;
    if (ms < Limits::Sched::Defaults::EvalPeriodMinMs) ms = Limits::Sched::Defaults::EvalPeriodMinMs;
    if (ms > Limits::Sched::Defaults::EvalPeriodMaxMs) ms = Limits::Sched::Defaults::EvalPeriodMaxMs;
    return (uint32_t)ms;
}

void SchedulerModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(evalPeriodVar);
    cfg.registerVar(protocolVar);

    timeSvc_ = services.get<TimeService>("time");
    ioSvc_ = services.get<IOOutputService>("io");
    transport_ = services.get<TransportService>("transport");
    cfgSvc_ = services.get<ConfigStoreService>("config");

    if (!timeSvc_) LOGE("time service missing");
    if (!transport_) LOGE("transport service missing");
    if (!cfgSvc_) LOGW("config service missing, set_config disabled");

    if (!ioSvc_ || !ioSvc_->bank) {
        LOGE("io service missing, outputs will not be driven");
        return;
    }
    evaluator_.bind(*ioSvc_->bank);
}

void SchedulerModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services)
{
    (void)cfg;
    (void)services;

    const ErrorCode err = engine_.load();
    switch (err) {
    case ErrorCode::Ok:
        LOGI("Restored %u task(s)", (unsigned)table_.size());
        break;
    case ErrorCode::StorageEmpty:
        LOGI("No stored tasks");
        break;
    case ErrorCode::StorageCorrupt:
        LOGW("Stored tasks unreadable, starting empty");
        break;
    default:
        LOGE("Task store load failed (%s)", errorCodeStr(err));
        break;
    }

    LOGI("protocol=%s eval=%lums",
         protocol_() == ScheduleProtocol::Legacy ? "legacy" : "incremental",
         (unsigned long)evalPeriodMs_());
}

void SchedulerModule::loop()
{
    if (!transport_ || !transport_->poll) {
        vTaskDelay(pdMS_TO_TICKS(1000));
        return;
    }

    for (uint8_t i = 0; i < Limits::Sched::MaxEventsPerLoop; ++i) {
        if (!transport_->poll(transport_->ctx, &event_)) break;
        dispatchEvent_(event_);
    }

    reportDrops_();

    const uint32_t now = millis();
    if ((uint32_t)(now - lastEvalMs_) >= evalPeriodMs_()) {
        lastEvalMs_ = now;
        evaluate_();
    }
}

void SchedulerModule::dispatchEvent_(const TransportEvent& ev)
{
    switch (ev.type) {
    case TransportEventType::Connected:
        session_.onConnected();
        LOGI("Peer connected (#%lu), waiting for time_sync", (unsigned long)session_.connectCount());
        break;
    case TransportEventType::Disconnected:
        session_.onDisconnected();
        LOGI("Peer disconnected, %u task(s) kept", (unsigned)table_.size());
        break;
    case TransportEventType::Message:
        handleMessage_(ev);
        break;
    }
}

void SchedulerModule::handleMessage_(const TransportEvent& ev)
{
    const ErrorCode err = decodeScheduleCommand(ev.payload, ev.len, protocol_(), cmd_);
    if (err != ErrorCode::Ok) {
        LOGW("Rejected message (%s, %u bytes)", errorCodeStr(err), (unsigned)ev.len);
        return;
    }
    LOGD("cmd=%s", scheduleCmdName(cmd_.type));
    applyCommand_(cmd_);
}

void SchedulerModule::applyTime_(uint64_t epochSec)
{
    if (!timeSvc_ || !timeSvc_->setEpoch) {
        LOGE("time_sync ignored: no time service");
        return;
    }
    if (!timeSvc_->setEpoch(timeSvc_->ctx, epochSec)) {
        LOGW("time_sync ignored: epoch %llu rejected", (unsigned long long)epochSec);
        return;
    }
    if (!session_.onTimeSync()) {
        LOGD("Clock set while disconnected, session stays unsynced");
        return;
    }
    // Re-evaluate right away instead of waiting for the next period.
    lastEvalMs_ = millis();
    evaluate_();
}

void SchedulerModule::applyCommand_(const ScheduleCommand& cmd)
{
    if (cmd.hasTime) applyTime_(cmd.epochSec);

    ErrorCode err = ErrorCode::Ok;
    switch (cmd.type) {
    case ScheduleCmdType::TimeSync:
        return;

    case ScheduleCmdType::GetSchedules:
        (void)publishSnapshot_();
        return;

    case ScheduleCmdType::SetConfig:
        if (!cfgSvc_ || !cfgSvc_->applyJson || !cfgSvc_->applyJson(cfgSvc_->ctx, cmd.configPatch)) {
            LOGW("set_config failed (%s)", errorCodeStr(ErrorCode::CfgApplyFailed));
        } else {
            LOGI("Config patch applied");
        }
        return;

    case ScheduleCmdType::Add:
        if (cmd.titleTruncated) LOGW("Title truncated for task %s", cmd.task.id);
        err = engine_.addTask(cmd.task);
        break;

    case ScheduleCmdType::Update:
        if (cmd.titleTruncated) LOGW("Title truncated for task %s", cmd.task.id);
        err = engine_.updateTask(cmd.task);
        break;

    case ScheduleCmdType::Delete:
        err = engine_.deleteTask(cmd.id);
        break;

    case ScheduleCmdType::SetSchedules: {
        uint8_t dropped = 0;
        err = engine_.replaceAll(cmd.tasks, cmd.taskCount, dropped);
        if (cmd.tasksSkipped || dropped) {
            LOGW("set_schedules: %u record(s) over capacity, %u dropped",
                 (unsigned)cmd.tasksSkipped, (unsigned)dropped);
        }
        break;
    }
    }

    if (err != ErrorCode::Ok) {
        if (err == ErrorCode::StorageWriteFailed || err == ErrorCode::StorageUnavailable) {
            LOGE("%s not persisted (%s), table rolled back", scheduleCmdName(cmd.type), errorCodeStr(err));
        } else {
            LOGW("%s rejected (%s)", scheduleCmdName(cmd.type), errorCodeStr(err));
        }
        return;
    }

    LOGI("%s ok, %u task(s)", scheduleCmdName(cmd.type), (unsigned)table_.size());
    (void)publishSnapshot_();
}

bool SchedulerModule::publishSnapshot_()
{
    if (!session_.isConnected()) {
        LOGD("Snapshot skipped (%s)", errorCodeStr(ErrorCode::NotConnected));
        return false;
    }

    const size_t len = encodeScheduleSnapshot(table_, snapshot_, sizeof(snapshot_));
    if (len == 0) {
        LOGE("Snapshot encode failed (%s)", errorCodeStr(ErrorCode::EncodeOverflow));
        return false;
    }

    const uint16_t maxPayload = transport_->maxPayload ? transport_->maxPayload(transport_->ctx) : 0;
    if (len > maxPayload) {
        LOGW("Snapshot %u bytes exceeds notify payload %u, peer will see it truncated",
             (unsigned)len, (unsigned)maxPayload);
    }

    if (!transport_->notify || !transport_->notify(transport_->ctx, snapshot_, len)) {
        LOGW("Snapshot notify failed");
        return false;
    }
    LOGD("Snapshot sent (%u bytes)", (unsigned)len);
    return true;
}

void SchedulerModule::evaluate_()
{
    if (!evaluator_.isBound() || !timeSvc_ || !timeSvc_->minuteOfDay) return;

    uint16_t minute = 0;
    const bool clockValid = session_.isTimeSynced() && timeSvc_->minuteOfDay(timeSvc_->ctx, &minute);
    const SchedulePassResult pass = runSchedulePass(evaluator_, table_, session_, clockValid, minute);
    if (!pass.ran) {
        if (!evalPaused_) {
            LOGI("Evaluation paused until next time_sync");
            evalPaused_ = true;
        }
        return;
    }
    if (evalPaused_) {
        LOGI("Evaluation running");
        evalPaused_ = false;
    }

    const ScheduleTickResult& r = pass.tick;
    if (r.writes == 0 && r.released == 0) return;

    if (r.failures) {
        LOGW("minute=%u: %u port write(s) refused", (unsigned)minute, (unsigned)r.failures);
    }
    LOGI("minute=%u: %u port change(s), %u released",
         (unsigned)minute, (unsigned)r.writes, (unsigned)r.released);
}

void SchedulerModule::reportDrops_()
{
    if (transport_->takeDropped) {
        const uint32_t dropped = transport_->takeDropped(transport_->ctx);
        if (dropped) LOGW("Transport dropped %lu message(s)", (unsigned long)dropped);
    }
    const uint32_t logDropped = Log::takeDropped();
    if (logDropped) LOGW("Log queue dropped %lu entries", (unsigned long)logDropped);
}
