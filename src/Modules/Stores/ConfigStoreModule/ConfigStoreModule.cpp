/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#include "Core/CommandRegistry.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"


bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json) {
    return ((ConfigStore*)ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJson(void* ctx, char* out, size_t outLen) {
    return ((ConfigStore*)ctx)->toJson(out, outLen);
}

bool ConfigStoreModule::svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated) {
    return ((ConfigStore*)ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules(void* ctx, const char** out, uint8_t max) {
    return ((ConfigStore*)ctx)->listModules(out, max);
}

bool ConfigStoreModule::svcErase(void* ctx) {
    return ((ConfigStore*)ctx)->erasePersistent();
}

bool ConfigStoreModule::cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ConfigStoreModule* self = (ConfigStoreModule*)userCtx;
    if (!self || !self->registry) return false;

    char module[24] = {0};
    if (req.args) {
        StaticJsonDocument<128> args;
        if (deserializeJson(args, req.args)) {
            writeErrorJson(reply, replyLen, ErrorCode::BadCfgJson, "config.get");
            return false;
        }
        const char* m = args["module"] | "";
        strncpy(module, m, sizeof(module) - 1);
    }

    char cfg[Limits::ConfigExportBuf] = {0};
    bool ok = false;
    bool truncated = false;
    if (module[0] != '\0') ok = self->registry->toJsonModule(module, cfg, sizeof(cfg), &truncated);
    else ok = self->registry->toJson(cfg, sizeof(cfg));

    if (!ok) {
        writeErrorJson(reply, replyLen, truncated ? ErrorCode::CfgTruncated : ErrorCode::Failed, "config.get");
        return false;
    }

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"config\":%s}", cfg);
    if (wrote < 0 || (size_t)wrote >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::CfgTruncated, "config.get");
        return false;
    }
    return true;
}

bool ConfigStoreModule::cmdSet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    ConfigStoreModule* self = (ConfigStoreModule*)userCtx;
    if (!self || !self->registry) return false;
    if (!req.args) {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "config.set");
        return false;
    }
    if (!self->registry->applyJson(req.args)) {
        LOGW("config.set rejected: %s", req.args);
        writeErrorJson(reply, replyLen, ErrorCode::CfgApplyFailed, "config.set");
        return false;
    }
    writeOkJson(reply, replyLen);
    return true;
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry = &cfg;

    svc.applyJson = svcApplyJson;
    svc.toJson = svcToJson;
    svc.toJsonModule = svcToJsonModule;
    svc.listModules = svcListModules;
    svc.erase = svcErase;
    svc.ctx = registry;
    services.add("config", &svc);

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (cmdSvc && cmdSvc->registerHandler) {
        cmdSvc->registerHandler(cmdSvc->ctx, "config.get", cmdGet, this);
        cmdSvc->registerHandler(cmdSvc->ctx, "config.set", cmdSet, this);
    }
    LOGI("ConfigStoreService registered");
}
