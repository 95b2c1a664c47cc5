#pragma once
/**
 * @file ControlsModule.h
 * @brief Filter reset and humidifier controls on top of the device link.
 */
#include "Core/ModulePassive.h"
#include "Core/EventBus/EventBus.h"
#include "Core/Services/Services.h"
#include "Domain/ControlProfiles.h"
#include "Modules/Controls/HumidifierControl.h"

/**
 * @brief Passive module exposing the per-model control commands.
 *
 * Capabilities come from CONTROL_PROFILES, selected by the configured model.
 * Writes go through the device service, which patches the cached status and
 * notifies listeners once the device accepted them.
 */
class ControlsModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "controls"; }

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        if (i == 3) return "device";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Active profile, nullptr when the model is unknown. */
    const ControlProfile* profile() const { return profile_; }

private:
    const DeviceLinkService* deviceSvc_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;

    const ControlProfile* profile_ = nullptr;
    bool listening_ = false;
    volatile uint8_t lastAction_ = 0xFF;

    void resolveProfile_();

    static void onEventStatic(const Event& e, void* user);
    void onEvent(const Event& e);
    static bool onStatus(void* ctx);

    bool writeValues_(JsonObjectConst values, const char* where, char* reply, size_t replyLen);
    const HumidifierProfile* humidifierOrError_(const char* where, char* reply, size_t replyLen);

    static bool cmdFilterReset(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdHumidifierOn(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdHumidifierOff(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdHumidifierSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdHumidifierState(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    bool handleFilterReset_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleHumidifierPower_(bool on, char* reply, size_t replyLen);
    bool handleHumidifierSet_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleHumidifierState_(char* reply, size_t replyLen);
};
