/**
 * @file CommandRegistry.cpp
 * @brief Implementation file.
 */
#include "CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/SnprintfCheck.h"
#include <cstring>
#include <cstdio>
#define LOG_TAG_CORE "CmdRegst"
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    AIRLINK_SNPRINTF_CHECKED(LOG_TAG_CORE, OUT, LEN, FMT, ##__VA_ARGS__)

static bool isJsonObjectReply_(const char* s, size_t len)
{
    if (!s || len == 0) return false;
    for (size_t i = 0; i < len; ++i) {
        const char c = s[i];
        if (c == '\0') return false;
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return c == '{';
    }
    return false;
}

static void writeFallbackError_(char* reply, size_t replyLen, ErrorCode code, const char* where)
{
    if (!reply || replyLen == 0) return;
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

const CommandEntry* CommandRegistry::find_(const char* cmd) const
{
    if (!cmd) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].cmd, cmd) == 0) return &entries_[i];
    }
    return nullptr;
}

bool CommandRegistry::registerHandler(const char* cmd, CommandHandler fn, void* userCtx) {
    if (!cmd || cmd[0] == '\0' || !fn) return false;
    if (count_ >= MAX_COMMANDS) {
        Log::warn(LOG_TAG_CORE, "command table full, dropping %s", cmd);
        return false;
    }
    if (find_(cmd)) return false;

    entries_[count_++] = {cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen) {
    if (reply && replyLen) reply[0] = '\0';

    if (!cmd || cmd[0] == '\0') {
        writeFallbackError_(reply, replyLen, ErrorCode::MissingCmd, "command");
        return false;
    }

    const CommandEntry* e = find_(cmd);
    if (!e) {
        writeFallbackError_(reply, replyLen, ErrorCode::UnknownCmd, "command");
        return false;
    }

    CommandRequest req{cmd, json, args};
    const bool ok = e->fn(e->userCtx, req, reply, replyLen);
    if (reply && replyLen && !isJsonObjectReply_(reply, replyLen)) {
        writeFallbackError_(reply, replyLen, ErrorCode::CmdHandlerFailed, "command.reply");
        return false;
    }
    return ok;
}
