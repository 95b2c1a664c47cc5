#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/Services/ICommand.h"

/** @brief Maximum number of registered commands. */
constexpr uint8_t MAX_COMMANDS = 16;

/** @brief Command invocation context. */
struct CommandRequest {
    const char* cmd;
    const char* json;   // full command line as received
    const char* args;   // serialized "args" object, or nullptr
};

/** @brief Registered command entry. */
struct CommandEntry {
    const char* cmd;
    CommandHandler fn;
    void* userCtx;
};

/**
 * @brief Registry of command handlers.
 *
 * Every reply is a JSON object. A handler that leaves something else in the
 * reply buffer gets its reply replaced by a CmdHandlerFailed error.
 */
class CommandRegistry {
public:
    /** @brief Register a handler for a command string. Duplicate names are rejected. */
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    /** @brief Execute a command into a reply buffer. */
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);

    /** @brief Number of registered commands. */
    uint8_t count() const { return count_; }
    /** @brief Name of command at index, or nullptr. */
    const char* name(uint8_t idx) const { return (idx < count_) ? entries_[idx].cmd : nullptr; }

private:
    CommandEntry entries_[MAX_COMMANDS]{};
    uint8_t count_ = 0;

    const CommandEntry* find_(const char* cmd) const;
};
