#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/NvsKeys.h"
#include "Core/EventBus/EventBus.h"
#include "Core/Services/Services.h"
#include "Core/LogHub.h"

/** @brief Log verbosity configuration. */
struct LogDispatchConfig {
    uint8_t level = (uint8_t)LogLevel::Info;
};

/**
 * @brief Passive module that runs a task to consume log hub entries.
 *
 * Owns the persisted log level (`log.level`, 0=debug .. 3=error) and applies
 * it at boot and on every change. Entries lost to a full queue are reported
 * through the sinks as one synthetic warning once the queue drains.
 */
class LogDispatcherModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }

    /** @brief Depends on log hub, event bus and command service. */
    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        return nullptr;
    }

    /** @brief Start dispatcher task and wire sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply the persisted level. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static void taskFn(void* pv);
    void run_();
    void reportDropped_();
    void applyLevel_();

    static void onEventStatic(const Event& e, void* user);
    static bool cmdStats(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;
    TaskHandle_t _task = nullptr;
    uint32_t _droppedTotal = 0;

    LogDispatchConfig _cfg;
    ConfigVariable<uint8_t,0> _levelVar {
        NVS_KEY(NvsKeys::Log::Level),"level","log",ConfigType::UInt8,
        &_cfg.level,ConfigPersistence::Persistent,0
    };
};
