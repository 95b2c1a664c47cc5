/**
 * @file ConsoleModule.cpp
 * @brief Implementation file.
 */
#include "ConsoleModule.h"
#include "Core/ErrorCodes.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "Console"
#include "Core/ModuleLog.h"

void ConsoleModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(echoVar);

    cmdSvc_ = services.get<CommandService>("cmd");
    if (!cmdSvc_) LOGW("command service unavailable");
}

void ConsoleModule::loop()
{
    if (!cfgData.enabled) {
        // Keep the RX buffer from filling while disabled.
        while (Serial.available() > 0) Serial.read();
        return;
    }

    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c < 0) break;

        if (c == '\n' || c == '\r') {
            if (overflow_) {
                writeErrorJson(reply_, sizeof(reply_), ErrorCode::ArgsTooLarge, "console");
                Serial.println(reply_);
                LOGW("line dropped (longer than %u bytes)", (unsigned)(sizeof(line_) - 1));
            } else if (lineLen_ > 0) {
                line_[lineLen_] = '\0';
                processLine_();
            }
            lineLen_ = 0;
            overflow_ = false;
            continue;
        }

        if (lineLen_ + 1 >= sizeof(line_)) {
            overflow_ = true;
            continue;
        }
        line_[lineLen_++] = (char)c;
    }
}

void ConsoleModule::processLine_()
{
    if (cfgData.echo) {
        Serial.print("> ");
        Serial.println(line_);
    }
    handleLine(line_, reply_, sizeof(reply_));
    Serial.println(reply_);
}

bool ConsoleModule::handleLine(const char* line, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::Console::JsonCmdBuf> doc;
    const DeserializationError err = deserializeJson(doc, line);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGW("bad cmd json (%s)", err ? err.c_str() : "not an object");
        writeErrorJson(reply, replyLen, ErrorCode::BadCmdJson, "console");
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonVariantConst cmdVar = root["cmd"];
    const char* cmdVal = cmdVar.is<const char*>() ? cmdVar.as<const char*>() : nullptr;
    if (!cmdVal || cmdVal[0] == '\0') {
        writeErrorJson(reply, replyLen, ErrorCode::MissingCmd, "console");
        return false;
    }
    if (!cmdSvc_ || !cmdSvc_->execute) {
        writeErrorJson(reply, replyLen, ErrorCode::CmdServiceUnavailable, "console");
        return false;
    }

    char cmd[Limits::Console::CmdName];
    size_t clen = strlen(cmdVal);
    if (clen >= sizeof(cmd)) clen = sizeof(cmd) - 1;
    memcpy(cmd, cmdVal, clen);
    cmd[clen] = '\0';

    const char* argsJson = nullptr;
    char argsBuf[Limits::Console::ArgsBuf] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            LOGW("args too large (cmd=%s)", cmd);
            writeErrorJson(reply, replyLen, ErrorCode::ArgsTooLarge, "console");
            return false;
        }
        argsJson = argsBuf;
    }

    const bool ok = cmdSvc_->execute(cmdSvc_->ctx, cmd, line, argsJson, reply, replyLen);
    if (!ok) LOGD("cmd %s failed", cmd);
    return ok;
}
