/**
 * @file ControlsModule.cpp
 * @brief Implementation file.
 */
#include "ControlsModule.h"
#include "Core/CommandRegistry.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Modules/Device/DeviceStatus.h"
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "Controls"
#include "Core/ModuleLog.h"

void ControlsModule::init(ConfigStore&, ServiceRegistry& services)
{
    deviceSvc_ = services.get<DeviceLinkService>("device");
    cmdSvc_ = services.get<CommandService>("cmd");

    auto ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus_) {
        eventBus_->subscribe(EventId::DeviceLinkReady, &ControlsModule::onEventStatic, this);
        eventBus_->subscribe(EventId::ConfigChanged, &ControlsModule::onEventStatic, this);
    }

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "filter.reset", &ControlsModule::cmdFilterReset, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "humidifier.on", &ControlsModule::cmdHumidifierOn, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "humidifier.off", &ControlsModule::cmdHumidifierOff, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "humidifier.set", &ControlsModule::cmdHumidifierSet, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "humidifier.state", &ControlsModule::cmdHumidifierState, this);
    }
}

void ControlsModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    resolveProfile_();
}

void ControlsModule::resolveProfile_()
{
    char model[Limits::Device::Model] = {0};
    if (!deviceSvc_ || !deviceSvc_->model || !deviceSvc_->model(deviceSvc_->ctx, model, sizeof(model))) {
        profile_ = nullptr;
        LOGE("device service unavailable, controls disabled");
        return;
    }

    profile_ = findControlProfile(model);
    if (!profile_) {
        LOGE("unsupported model '%s', controls disabled", model);
        return;
    }
    LOGI("model %s: %u filters, humidifier=%s", profile_->model, (unsigned)profile_->filterCount,
         profile_->humidifier ? "yes" : "no");
}

// ---------------------------------------------------------------------------
// Events and status listener
// ---------------------------------------------------------------------------

void ControlsModule::onEventStatic(const Event& e, void* user)
{
    static_cast<ControlsModule*>(user)->onEvent(e);
}

void ControlsModule::onEvent(const Event& e)
{
    if (e.id == EventId::ConfigChanged) {
        const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
        if (p && strcmp(p->nvsKey, NvsKeys::Device::Model) == 0) resolveProfile_();
        return;
    }

    if (e.id != EventId::DeviceLinkReady || listening_) return;
    if (!deviceSvc_ || !deviceSvc_->addListener) return;
    listening_ = deviceSvc_->addListener(deviceSvc_->ctx, &ControlsModule::onStatus, this);
    if (!listening_) LOGW("status listener registration failed");
}

bool ControlsModule::onStatus(void* ctx)
{
    ControlsModule* self = static_cast<ControlsModule*>(ctx);
    const ControlProfile* prof = self->profile_;
    if (!prof || !prof->humidifier) return true;

    DeviceStatus status;
    if (!self->deviceSvc_->copyStatus(self->deviceSvc_->ctx, status)) return true;

    const HumidifierAction action = humidifierAction(status, *prof->humidifier);
    if ((uint8_t)action != self->lastAction_) {
        self->lastAction_ = (uint8_t)action;
        LOGI("humidifier %s", humidifierActionStr(action));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool ControlsModule::writeValues_(JsonObjectConst values, const char* where, char* reply, size_t replyLen)
{
    if (!deviceSvc_ || !deviceSvc_->setValues) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, where);
        return false;
    }
    ErrorCode err = ErrorCode::None;
    if (!deviceSvc_->setValues(deviceSvc_->ctx, values, &err)) {
        if (err == ErrorCode::None) err = ErrorCode::Failed;
        LOGW("%s failed: %s", where, errorCodeStr(err));
        writeErrorJson(reply, replyLen, err, where);
        return false;
    }
    return true;
}

const HumidifierProfile* ControlsModule::humidifierOrError_(const char* where, char* reply, size_t replyLen)
{
    if (!profile_) {
        writeErrorJson(reply, replyLen, ErrorCode::UnsupportedModel, where);
        return nullptr;
    }
    if (!profile_->humidifier) {
        writeErrorJson(reply, replyLen, ErrorCode::UnsupportedFeature, where);
        return nullptr;
    }
    return profile_->humidifier;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

bool ControlsModule::cmdFilterReset(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ControlsModule* self = (ControlsModule*)userCtx;
    if (!self) return false;
    return self->handleFilterReset_(req, reply, replyLen);
}

bool ControlsModule::cmdHumidifierOn(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    ControlsModule* self = (ControlsModule*)userCtx;
    if (!self) return false;
    return self->handleHumidifierPower_(true, reply, replyLen);
}

bool ControlsModule::cmdHumidifierOff(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    ControlsModule* self = (ControlsModule*)userCtx;
    if (!self) return false;
    return self->handleHumidifierPower_(false, reply, replyLen);
}

bool ControlsModule::cmdHumidifierSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ControlsModule* self = (ControlsModule*)userCtx;
    if (!self) return false;
    return self->handleHumidifierSet_(req, reply, replyLen);
}

bool ControlsModule::cmdHumidifierState(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    ControlsModule* self = (ControlsModule*)userCtx;
    if (!self) return false;
    return self->handleHumidifierState_(reply, replyLen);
}

bool ControlsModule::handleFilterReset_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "filter.reset";
    if (!profile_) {
        writeErrorJson(reply, replyLen, ErrorCode::UnsupportedModel, kWhere);
        return false;
    }

    StaticJsonDocument<Limits::Device::ControlDocCapacity> args;
    if (!req.args || deserializeJson(args, req.args)) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, kWhere);
        return false;
    }
    const char* key = args["filter"] | (const char*)nullptr;
    if (!key || key[0] == '\0') {
        writeErrorJson(reply, replyLen, ErrorCode::MissingValue, kWhere);
        return false;
    }

    const FilterProfile* filter = findFilterProfile(*profile_, key);
    if (!filter) {
        writeErrorJson(reply, replyLen, ErrorCode::UnsupportedFilter, kWhere);
        return false;
    }

    DeviceStatus status;
    if (!deviceSvc_ || !deviceSvc_->copyStatus(deviceSvc_->ctx, status)) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, kWhere);
        return false;
    }

    StatusDocument doc;
    if (!status.parse(doc)) {
        writeErrorJson(reply, replyLen, ErrorCode::BadStatusJson, kWhere);
        return false;
    }
    JsonVariantConst total = doc[filter->totalKey];
    if (!doc.containsKey(filter->key) || total.isNull()) {
        writeErrorJson(reply, replyLen, ErrorCode::UnsupportedFilter, kWhere);
        return false;
    }

    StaticJsonDocument<Limits::Device::ControlDocCapacity> values;
    values[filter->key] = total;
    if (!writeValues_(values.as<JsonObjectConst>(), kWhere, reply, replyLen)) {
        LOGE("failed to reset filter %s", filter->key);
        return false;
    }

    char totalText[24] = {0};
    status.getText(filter->totalKey, totalText, sizeof(totalText));
    LOGI("filter %s reset to %s", filter->key, totalText);
    snprintf(reply, replyLen, "{\"ok\":true,\"filter\":\"%s\",\"label\":\"%s\",\"value\":\"%s\"}",
             filter->key, filter->label, totalText);
    return true;
}

bool ControlsModule::handleHumidifierPower_(bool on, char* reply, size_t replyLen)
{
    const char* where = on ? "humidifier.on" : "humidifier.off";
    const HumidifierProfile* h = humidifierOrError_(where, reply, replyLen);
    if (!h) return false;
    if (!h->switchable) {
        writeErrorJson(reply, replyLen, ErrorCode::UnsupportedFeature, where);
        return false;
    }

    // Off only drops the humidifying function; the fan keeps running.
    StaticJsonDocument<Limits::Device::ControlDocCapacity> values;
    if (on) {
        values[h->powerKey] = h->powerOn;
        values[h->functionKey] = h->functionHumidifying;
    } else {
        values[h->functionKey] = h->functionIdle;
    }

    if (!writeValues_(values.as<JsonObjectConst>(), where, reply, replyLen)) return false;
    writeOkJson(reply, replyLen);
    return true;
}

bool ControlsModule::handleHumidifierSet_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "humidifier.set";
    const HumidifierProfile* h = humidifierOrError_(kWhere, reply, replyLen);
    if (!h) return false;

    StaticJsonDocument<Limits::Device::ControlDocCapacity> args;
    if (!req.args || deserializeJson(args, req.args)) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, kWhere);
        return false;
    }
    JsonVariantConst humidity = args["humidity"];
    if (humidity.isNull()) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingValue, kWhere);
        return false;
    }
    if (!humidity.is<int32_t>()) {
        writeErrorJson(reply, replyLen, ErrorCode::InvalidValue, kWhere);
        return false;
    }

    HumidifierTargetInput in{};
    in.requested = humidity.as<int32_t>();

    DeviceStatus status;
    if (deviceSvc_ && deviceSvc_->copyStatus(deviceSvc_->ctx, status)) {
        in.hasCurrentTarget = status.getInt(h->targetKey, in.currentTarget);
    }

    const int32_t target = computeTargetHumidity(in, *h);

    StaticJsonDocument<Limits::Device::ControlDocCapacity> values;
    values[h->targetKey] = target;
    if (!writeValues_(values.as<JsonObjectConst>(), kWhere, reply, replyLen)) return false;

    LOGI("target humidity %ld (requested %ld)", (long)target, (long)in.requested);
    snprintf(reply, replyLen, "{\"ok\":true,\"target\":%ld}", (long)target);
    return true;
}

bool ControlsModule::handleHumidifierState_(char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "humidifier.state";
    const HumidifierProfile* h = humidifierOrError_(kWhere, reply, replyLen);
    if (!h) return false;

    DeviceStatus status;
    HumidifierReport r;
    if (!deviceSvc_ || !deviceSvc_->copyStatus(deviceSvc_->ctx, status) ||
        !readHumidifierReport(status, *h, r)) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, kWhere);
        return false;
    }

    StaticJsonDocument<256> doc;
    doc["ok"] = true;
    doc["action"] = humidifierActionStr(r.action);
    doc["is_on"] = (r.action == HumidifierAction::Humidifying);
    if (r.hasHumidity) doc["humidity"] = r.humidity;
    else doc["humidity"] = nullptr;
    if (r.hasTarget) doc["target"] = r.target;
    else doc["target"] = nullptr;
    doc["min"] = h->minHumidity;
    doc["max"] = h->maxHumidity;
    doc["step"] = h->step;
    serializeJson(doc, reply, replyLen);
    return true;
}
