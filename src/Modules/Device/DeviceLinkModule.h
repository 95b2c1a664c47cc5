#pragma once
/**
 * @file DeviceLinkModule.h
 * @brief Active module hosting the device connection coordinator.
 */
#include <atomic>
#include <memory>

#include "Core/Module.h"
#include "Core/EventBus/EventBus.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Modules/Device/DeviceCoordinator.h"

/** @brief Device link configuration values. */
struct DeviceLinkConfig {
    bool enabled = true;
    char host[Limits::Device::Host] = "192.168.1.50";
    char deviceId[Limits::Device::DeviceId] = "";
    char model[Limits::Device::Model] = "AC2729";
};

/**
 * @brief Active module that owns one DeviceCoordinator.
 *
 * The task retries the first refresh with backoff until it succeeds, then
 * the coordinator runs on its own tasks and timer.
 */
class DeviceLinkModule : public Module {
public:
    explicit DeviceLinkModule(IDeviceClientFactory& factory) : factory_(factory) {}

    /** @brief Module id. */
    const char* moduleId() const override { return "device"; }
    /** @brief Task name. */
    const char* taskName() const override { return "device"; }

    /** @brief Device link depends on log hub, event bus and command service. */
    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 6144; }
    uint32_t loopDelayMs() const override { return 100; }

    /** @brief Coordinator accessor (valid after init). */
    DeviceCoordinator* coordinator() { return coordinator_.get(); }

private:
    IDeviceClientFactory& factory_;
    std::unique_ptr<DeviceCoordinator> coordinator_;

    DeviceLinkConfig cfgData;
    ConfigStore* cfgStore_ = nullptr;
    EventBus* eventBus_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    DeviceLinkService svc_{};

    volatile bool ready_ = false;
    volatile bool hostChanged_ = false;
    volatile bool enabledChanged_ = false;
    bool listening_ = false;
    uint32_t nextAttemptMs_ = 0;
    uint32_t retryDelayMs_ = Limits::Device::Backoff::MinMs;
    uint8_t retryCount_ = 0;
    std::atomic<uint32_t> statusSeq_{0};

    ConfigVariable<bool,0> enabledVar {
        NVS_KEY(NvsKeys::Device::Enabled),"enabled","device",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<char,0> hostVar {
        NVS_KEY(NvsKeys::Device::Host),"host","device",ConfigType::CharArray,
        (char*)cfgData.host,ConfigPersistence::Persistent,sizeof(cfgData.host)
    };
    ConfigVariable<char,0> deviceIdVar {
        NVS_KEY(NvsKeys::Device::DeviceId),"device_id","device",ConfigType::CharArray,
        (char*)cfgData.deviceId,ConfigPersistence::Persistent,sizeof(cfgData.deviceId)
    };
    ConfigVariable<char,0> modelVar {
        NVS_KEY(NvsKeys::Device::Model),"model","device",ConfigType::CharArray,
        (char*)cfgData.model,ConfigPersistence::Persistent,sizeof(cfgData.model)
    };

    void attemptFirstRefresh_(uint32_t now);
    void scheduleRetry_(uint32_t now);
    void applyHostChange_();
    void applyEnabledChange_();
    void postLink_(EventId id);

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);

    static bool onStatusUpdated(void* ctx);
    static void onLinkEvent(void* ctx, DeviceCoordinator::LinkEvent ev);

    static bool cmdStatus(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdReconnect(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    static bool svcIsReady(void* ctx);
    static uint8_t svcState(void* ctx);
    static bool svcCopyStatus(void* ctx, DeviceStatus& out);
    static bool svcModel(void* ctx, char* out, size_t outLen);
    static bool svcAddListener(void* ctx, DeviceListenerFn fn, void* fnCtx);
    static bool svcRemoveListener(void* ctx, DeviceListenerFn fn, void* fnCtx);
    static bool svcSetValues(void* ctx, JsonObjectConst values, ErrorCode* err);
    static bool svcReconnect(void* ctx);
};
