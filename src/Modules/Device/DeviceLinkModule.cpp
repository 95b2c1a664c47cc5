/**
 * @file DeviceLinkModule.cpp
 * @brief Implementation file.
 */
#include "DeviceLinkModule.h"
#include "Core/CommandRegistry.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <esp_system.h>
#include <string.h>
#define LOG_TAG "DevLink"
#include "Core/ModuleLog.h"

static uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV) {
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = esp_random();
    uint32_t delta = r % (2U * span + 1U);
    int32_t signedDelta = (int32_t)delta - (int32_t)span;
    int32_t out = (int32_t)baseMs + signedDelta;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

void DeviceLinkModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore_ = &cfg;
    cfg.registerVar(enabledVar);
    cfg.registerVar(hostVar);
    cfg.registerVar(deviceIdVar);
    cfg.registerVar(modelVar);

    coordinator_.reset(new DeviceCoordinator(factory_, cfgData.host));
    coordinator_->setLinkHook(&DeviceLinkModule::onLinkEvent, this);

    auto ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    if (eventBus_) {
        eventBus_->subscribe(EventId::ConfigChanged, &DeviceLinkModule::onEventStatic, this);
    }

    cmdSvc_ = services.get<CommandService>("cmd");
    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "device.status", &DeviceLinkModule::cmdStatus, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "device.reconnect", &DeviceLinkModule::cmdReconnect, this);
        cmdSvc_->registerHandler(cmdSvc_->ctx, "device.set", &DeviceLinkModule::cmdSet, this);
    }

    svc_.isReady = &DeviceLinkModule::svcIsReady;
    svc_.state = &DeviceLinkModule::svcState;
    svc_.copyStatus = &DeviceLinkModule::svcCopyStatus;
    svc_.model = &DeviceLinkModule::svcModel;
    svc_.addListener = &DeviceLinkModule::svcAddListener;
    svc_.removeListener = &DeviceLinkModule::svcRemoveListener;
    svc_.setValues = &DeviceLinkModule::svcSetValues;
    svc_.reconnect = &DeviceLinkModule::svcReconnect;
    svc_.ctx = this;
    if (!services.add("device", &svc_)) {
        LOGE("service registration failed");
    }
}

void DeviceLinkModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    coordinator_->setHost(cfgData.host);
    nextAttemptMs_ = millis();
    LOGI("device host=%s model=%s id=%s enabled=%s", cfgData.host, cfgData.model,
         cfgData.deviceId[0] ? cfgData.deviceId : "-", cfgData.enabled ? "true" : "false");
}

// ---------------------------------------------------------------------------
// Task loop
// ---------------------------------------------------------------------------

void DeviceLinkModule::loop()
{
    if (enabledChanged_) {
        enabledChanged_ = false;
        applyEnabledChange_();
    }
    if (hostChanged_) {
        hostChanged_ = false;
        applyHostChange_();
    }

    if (!cfgData.enabled || ready_) return;
    if (coordinator_->state() == DeviceCoordinator::State::Shutdown) return;

    const uint32_t now = millis();
    if ((int32_t)(now - nextAttemptMs_) < 0) return;
    attemptFirstRefresh_(now);
}

void DeviceLinkModule::attemptFirstRefresh_(uint32_t now)
{
    ErrorCode err = ErrorCode::None;
    if (!coordinator_->firstRefresh(&err)) {
        scheduleRetry_(now);
        return;
    }

    ready_ = true;
    retryCount_ = 0;
    retryDelayMs_ = Limits::Device::Backoff::MinMs;

    if (!listening_) {
        listening_ = coordinator_->addListener(&DeviceLinkModule::onStatusUpdated, this).active();
    }
    postLink_(EventId::DeviceLinkReady);
}

void DeviceLinkModule::scheduleRetry_(uint32_t now)
{
    retryCount_++;
    const uint32_t waitMs = retryDelayMs_;
    nextAttemptMs_ = now + waitMs;

    uint32_t next = retryDelayMs_ * 2U;
    next = clampU32(next, Limits::Device::Backoff::MinMs, Limits::Device::Backoff::MaxMs);
    retryDelayMs_ = jitterMs(next, Limits::Device::Backoff::JitterPct);

    LOGW("first refresh failed (attempt %u), retry in %lu ms", (unsigned)retryCount_, (unsigned long)waitMs);
}

void DeviceLinkModule::applyHostChange_()
{
    coordinator_->setHost(cfgData.host);
    if (ready_) {
        LOGI("host changed to %s, reconnecting", cfgData.host);
        if (!coordinator_->reconnect()) LOGW("reconnect deferred, new host applies at next watchdog expiry");
        return;
    }
    // Not connected yet: retry right away against the new host.
    retryCount_ = 0;
    retryDelayMs_ = Limits::Device::Backoff::MinMs;
    nextAttemptMs_ = millis();
}

void DeviceLinkModule::applyEnabledChange_()
{
    if (cfgData.enabled) {
        if (coordinator_->state() == DeviceCoordinator::State::Shutdown) {
            LOGI("device link re-enabled, takes effect after restart");
        }
        return;
    }
    LOGI("device link disabled");
    coordinator_->shutdown();
    if (ready_) postLink_(EventId::DeviceLinkLost);
    ready_ = false;
}

void DeviceLinkModule::postLink_(EventId id)
{
    if (!eventBus_) return;
    DeviceLinkPayload p{};
    p.state = (uint8_t)coordinator_->state();
    p.maxAgeS = coordinator_->maxAgeS();
    p.reconnects = coordinator_->counters().reconnectsCompleted;
    if (!eventBus_->post(id, &p, sizeof(p))) {
        LOGW("event %u dropped", (unsigned)id);
    }
}

// ---------------------------------------------------------------------------
// Events and coordinator callbacks
// ---------------------------------------------------------------------------

void DeviceLinkModule::onEventStatic(const Event& e, void* user)
{
    static_cast<DeviceLinkModule*>(user)->onEvent(e);
}

void DeviceLinkModule::onEvent(const Event& e)
{
    if (e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
    if (!p) return;

    if (strcmp(p->nvsKey, NvsKeys::Device::Host) == 0) hostChanged_ = true;
    else if (strcmp(p->nvsKey, NvsKeys::Device::Enabled) == 0) enabledChanged_ = true;
}

bool DeviceLinkModule::onStatusUpdated(void* ctx)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(ctx);
    if (!self->eventBus_) return true;
    DeviceStatusUpdatedPayload p{};
    p.seq = self->statusSeq_.fetch_add(1) + 1;
    // A full queue only delays consumers until the next update.
    self->eventBus_->post(EventId::DeviceStatusUpdated, &p, sizeof(p));
    return true;
}

void DeviceLinkModule::onLinkEvent(void* ctx, DeviceCoordinator::LinkEvent ev)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(ctx);
    switch (ev) {
        case DeviceCoordinator::LinkEvent::Lost:
            self->postLink_(EventId::DeviceLinkLost);
            break;
        case DeviceCoordinator::LinkEvent::Reconnected:
            self->postLink_(EventId::DeviceReconnected);
            break;
        case DeviceCoordinator::LinkEvent::ReconnectFailed:
            break;
    }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

bool DeviceLinkModule::cmdStatus(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(userCtx);
    DeviceCoordinator& c = *self->coordinator_;
    const DeviceCoordinator::Counters n = c.counters();

    DeviceStatus status;
    const bool hasStatus = c.copyStatus(status);

    StaticJsonDocument<512> doc;
    doc["ok"] = true;
    doc["state"] = deviceStateStr(c.state());
    doc["host"] = (const char*)self->cfgData.host;
    doc["model"] = (const char*)self->cfgData.model;
    doc["max_age_s"] = c.maxAgeS();
    doc["watchdog_ms"] = c.watchdogTimeoutMs();
    doc["listeners"] = c.listenerCount();
    doc["observing"] = c.isObserving();
    doc["updates"] = n.updates;
    doc["reconnects"] = n.reconnectsCompleted;
    doc["reconnect_attempts"] = n.reconnectsStarted;
    doc["listener_faults"] = n.listenerFaults;
    if (hasStatus) doc["status"] = serialized(status.json(), status.length());
    else doc["status"] = nullptr;

    if (measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::StatusTooLarge, "device.status");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

bool DeviceLinkModule::cmdReconnect(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(userCtx);
    if (!self->cfgData.enabled) {
        writeErrorJson(reply, replyLen, ErrorCode::Disabled, "device.reconnect");
        return false;
    }
    if (!self->coordinator_->reconnect()) {
        const bool down = self->coordinator_->state() == DeviceCoordinator::State::Shutdown;
        writeErrorJson(reply, replyLen, down ? ErrorCode::ShuttingDown : ErrorCode::NotReady,
                       "device.reconnect");
        return false;
    }
    writeOkJson(reply, replyLen);
    return true;
}

bool DeviceLinkModule::cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(userCtx);
    if (!req.args) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "device.set");
        return false;
    }

    StaticJsonDocument<Limits::Console::JsonCmdBuf> doc;
    if (deserializeJson(doc, req.args) || !doc.is<JsonObject>()) {
        writeErrorJson(reply, replyLen, ErrorCode::BadCmdJson, "device.set");
        return false;
    }
    JsonObjectConst args = doc.as<JsonObjectConst>();

    // Accept {"values":{...}} or {"key":"...","value":...}.
    ErrorCode err = ErrorCode::None;
    bool ok = false;
    JsonObjectConst values = args["values"];
    if (!values.isNull()) {
        ok = self->coordinator_->setControlValues(values, &err);
    } else {
        const char* key = args["key"] | (const char*)nullptr;
        JsonVariantConst value = args["value"];
        if (!key || value.isNull()) {
            writeErrorJson(reply, replyLen, ErrorCode::MissingValue, "device.set");
            return false;
        }
        ok = self->coordinator_->setControlValue(key, value, &err);
    }

    if (!ok) {
        writeErrorJson(reply, replyLen, err == ErrorCode::None ? ErrorCode::Failed : err, "device.set");
        return false;
    }
    writeOkJson(reply, replyLen);
    return true;
}

// ---------------------------------------------------------------------------
// Service
// ---------------------------------------------------------------------------

bool DeviceLinkModule::svcIsReady(void* ctx)
{
    return static_cast<DeviceLinkModule*>(ctx)->ready_;
}

uint8_t DeviceLinkModule::svcState(void* ctx)
{
    return (uint8_t)static_cast<DeviceLinkModule*>(ctx)->coordinator_->state();
}

bool DeviceLinkModule::svcCopyStatus(void* ctx, DeviceStatus& out)
{
    return static_cast<DeviceLinkModule*>(ctx)->coordinator_->copyStatus(out);
}

bool DeviceLinkModule::svcModel(void* ctx, char* out, size_t outLen)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(ctx);
    if (!out || outLen == 0) return false;
    const size_t len = strlen(self->cfgData.model);
    if (len >= outLen) return false;
    memcpy(out, self->cfgData.model, len + 1);
    return true;
}

bool DeviceLinkModule::svcAddListener(void* ctx, DeviceListenerFn fn, void* fnCtx)
{
    return static_cast<DeviceLinkModule*>(ctx)->coordinator_->addListener(fn, fnCtx).active();
}

bool DeviceLinkModule::svcRemoveListener(void* ctx, DeviceListenerFn fn, void* fnCtx)
{
    return static_cast<DeviceLinkModule*>(ctx)->coordinator_->removeListener(fn, fnCtx);
}

bool DeviceLinkModule::svcSetValues(void* ctx, JsonObjectConst values, ErrorCode* err)
{
    DeviceLinkModule* self = static_cast<DeviceLinkModule*>(ctx);
    if (!self->ready_) {
        setError(err, ErrorCode::ConnectionNotReady);
        return false;
    }
    return self->coordinator_->setControlValues(values, err);
}

bool DeviceLinkModule::svcReconnect(void* ctx)
{
    return static_cast<DeviceLinkModule*>(ctx)->coordinator_->reconnect();
}
