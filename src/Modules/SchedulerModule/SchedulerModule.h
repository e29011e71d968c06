#pragma once
/**
 * @file SchedulerModule.h
 * @brief Schedule engine task: command dispatch, persistence and evaluation.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/Storage/IBlobStore.h"
#include "Core/SystemLimits.h"
#include "Modules/Network/BleTransportModule/TransportSession.h"
#include "Modules/SchedulerModule/ScheduleCodec.h"
#include "Modules/SchedulerModule/ScheduleEngine.h"
#include "Modules/SchedulerModule/ScheduleEvaluator.h"
#include "Modules/SchedulerModule/SchedulePass.h"
#include "Modules/SchedulerModule/TaskRecordStore.h"
#include "Modules/SchedulerModule/TaskTable.h"

/** @brief Scheduler configuration values. */
struct SchedulerConfig {
    int32_t evalPeriodMs = Limits::Sched::Defaults::EvalPeriodMs;
    uint8_t protocol = (uint8_t)ScheduleProtocol::Incremental;
};

/**
 * @brief Active module owning the task table.
 *
 * This task is the only context that reads or mutates the table, the task
 * store, the transport session and the evaluator. Transport callbacks only
 * queue events; they are consumed here in arrival order.
 */
class SchedulerModule : public Module {
public:
    explicit SchedulerModule(IBlobStore& taskBlobStore)
        : store_(taskBlobStore), engine_(table_, store_) {}

    /** @brief Module id. */
    const char* moduleId() const override { return "scheduler"; }
    /** @brief Task name. */
    const char* taskName() const override { return "sched"; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "config";
        if (i == 2) return "time";
        if (i == 3) return "io";
        if (i == 4) return "transport";
        return nullptr;
    }

    uint16_t taskStackSize() const override { return Limits::Sched::TaskStackSize; }

    /** @brief Register config and resolve services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Restore the persisted task table. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Drain transport events, then evaluate when due. */
    void loop() override;

private:
    SchedulerConfig cfgData{};

    const TimeService* timeSvc_ = nullptr;
    const IOOutputService* ioSvc_ = nullptr;
    const TransportService* transport_ = nullptr;
    const ConfigStoreService* cfgSvc_ = nullptr;

    TaskTable table_;
    TaskRecordStore store_;
    ScheduleEngine engine_;
    ScheduleEvaluator evaluator_;
    TransportSession session_;

    TransportEvent event_{};
    ScheduleCommand cmd_{};
    char snapshot_[Limits::Sched::SnapshotBuf] = {0};

    uint32_t lastEvalMs_ = 0;
    bool evalPaused_ = true;

    ConfigVariable<int32_t,0> evalPeriodVar {
        NVS_KEY(NvsKeys::Sched::EvalPeriodMs),"eval_ms","sched",ConfigType::Int32,
        &cfgData.evalPeriodMs,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t,0> protocolVar {
        NVS_KEY(NvsKeys::Sched::Protocol),"proto","sched",ConfigType::UInt8,
        &cfgData.protocol,ConfigPersistence::Persistent,0
    };

    ScheduleProtocol protocol_() const;
    uint32_t evalPeriodMs_() const;

    void dispatchEvent_(const TransportEvent& ev);
    void handleMessage_(const TransportEvent& ev);
    void applyCommand_(const ScheduleCommand& cmd);
    void applyTime_(uint64_t epochSec);
    bool publishSnapshot_();
    void evaluate_();
    void reportDrops_();
};
