/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <stdio.h>
#include <string.h>

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(_levelVar);

    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    auto ebSvc = services.get<EventBusService>("eventbus");
    if (ebSvc && ebSvc->bus) {
        ebSvc->bus->subscribe(EventId::ConfigChanged, &LogDispatcherModule::onEventStatic, this);
    }
    auto cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc && cmdSvc->registerHandler) {
        cmdSvc->registerHandler(cmdSvc->ctx, "log.stats", &LogDispatcherModule::cmdStats, this);
    }

    /// the hub object is carried by the service ctx
    if (!hubSvc || !hubSvc->ctx || !_sinkReg) return;
    _hub = static_cast<LogHub*>(hubSvc->ctx);

    const BaseType_t ok = xTaskCreatePinnedToCore(
        LogDispatcherModule::taskFn,
        "LogDispatch",
        4096,                ///< stack
        this,                ///< param
        1,                   ///< low priority
        &_task,
        1                    ///< core 1
    );
    if (ok != pdPASS) {
        Serial.println("[LOG][ERR] dispatcher task creation failed");
        _task = nullptr;
    }
}

void LogDispatcherModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    applyLevel_();
}

void LogDispatcherModule::applyLevel_() {
    const LogLevel lvl = logLevelFromByte(_cfg.level);
    Log::setMinLevel(lvl);
    // Bypass the threshold so the change is visible at any level. A full
    // queue counts the entry as dropped.
    LogEntry e{};
    e.ts_ms = millis();
    e.lvl = LogLevel::Warn;
    strncpy(e.tag, "LogDisp", sizeof(e.tag) - 1);
    snprintf(e.msg, sizeof(e.msg), "log level %s", logLevelName(lvl));
    if (_hub) _hub->enqueue(e);
}

void LogDispatcherModule::onEventStatic(const Event& e, void* user) {
    if (e.id != EventId::ConfigChanged || !e.payload) return;
    const ConfigChangedPayload* p = (const ConfigChangedPayload*)e.payload;
    if (strcmp(p->nvsKey, NvsKeys::Log::Level) != 0) return;
    static_cast<LogDispatcherModule*>(user)->applyLevel_();
}

void LogDispatcherModule::taskFn(void* pv) {
    static_cast<LogDispatcherModule*>(pv)->run_();
}

void LogDispatcherModule::run_() {
    LogEntry e;
    while (true) {
        if (_hub->dequeue(e, pdMS_TO_TICKS(1000))) {
            _sinkReg->dispatch(_sinkReg->ctx, e);
            continue;
        }
        /// queue idle: report any loss
        reportDropped_();
    }
}

void LogDispatcherModule::reportDropped_() {
    const uint32_t lost = _hub->takeDropped();
    if (lost == 0) return;
    _droppedTotal += lost;

    LogEntry e{};
    e.ts_ms = millis();
    e.lvl = LogLevel::Warn;
    strncpy(e.tag, "LogHub", sizeof(e.tag) - 1);
    snprintf(e.msg, sizeof(e.msg), "%lu log entries dropped (queue full)", (unsigned long)lost);
    _sinkReg->dispatch(_sinkReg->ctx, e);
}

bool LogDispatcherModule::cmdStats(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    LogDispatcherModule* self = static_cast<LogDispatcherModule*>(userCtx);
    if (!self->_sinkReg) {
        writeErrorJson(reply, replyLen, ErrorCode::NotReady, "log.stats");
        return false;
    }

    StaticJsonDocument<384> doc;
    doc["ok"] = true;
    doc["level"] = logLevelName(Log::minLevel());
    doc["dropped"] = self->_droppedTotal + (self->_hub ? self->_hub->dropped() : 0);
    JsonArray sinks = doc.createNestedArray("sinks");
    const int n = self->_sinkReg->count(self->_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService s = self->_sinkReg->get(self->_sinkReg->ctx, i);
        JsonObject o = sinks.createNestedObject();
        o["name"] = s.name ? s.name : "-";
        o["written"] = self->_sinkReg->written(self->_sinkReg->ctx, i);
    }
    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::CmdHandlerFailed, "log.stats");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}
