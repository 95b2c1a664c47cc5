/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#include <ArduinoJson.h>
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"


bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    CommandRegistry* reg = (CommandRegistry*)ctx;
    if (!reg->registerHandler(cmd, fn, userCtx)) {
        LOGW("register failed: %s", cmd ? cmd : "(null)");
        return false;
    }
    return true;
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    CommandModule* self = (CommandModule*)userCtx;
    StaticJsonDocument<768> doc;
    doc["ok"] = true;
    JsonArray cmds = doc.createNestedArray("cmds");
    for (uint8_t i = 0; i < self->registry.count(); ++i) {
        cmds.add(self->registry.name(i));
    }
    if (doc.overflowed() || measureJson(doc) >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::CmdHandlerFailed, "cmd.list");
        return false;
    }
    serializeJson(doc, reply, replyLen);
    return true;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    svc.registerHandler = svcRegister;
    svc.execute = svcExecute;
    svc.ctx = &registry;
    services.add("cmd", &svc);

    registry.registerHandler("cmd.list", cmdList, this);
    LOGI("CommandService registered");
}
