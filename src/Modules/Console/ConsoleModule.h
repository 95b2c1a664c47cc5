#pragma once
/**
 * @file ConsoleModule.h
 * @brief Line-based JSON command console over Serial.
 */
#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"

/** @brief Console configuration values. */
struct ConsoleConfig {
    bool enabled = true;
    bool echo = false;
};

/**
 * @brief Active module reading `{"cmd":"...","args":{...}}` lines from Serial.
 *
 * Each line is executed through the command service and the JSON reply is
 * printed on its own line.
 */
class ConsoleModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "console"; }
    /** @brief Task name. */
    const char* taskName() const override { return "console"; }

    /** @brief Console depends on log hub and command service. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    uint16_t taskStackSize() const override { return 8192; }
    uint32_t loopDelayMs() const override { return 20; }

    /**
     * @brief Execute one command line and write the JSON reply.
     * @return true when the command ran and succeeded.
     */
    bool handleLine(const char* line, char* reply, size_t replyLen);

private:
    ConsoleConfig cfgData;
    const CommandService* cmdSvc_ = nullptr;

    char line_[Limits::Console::LineBuf] = {0};
    size_t lineLen_ = 0;
    bool overflow_ = false;
    char reply_[Limits::Console::Reply] = {0};

    ConfigVariable<bool,0> enabledVar {
        NVS_KEY(NvsKeys::Console::Enabled),"enabled","console",ConfigType::Bool,
        &cfgData.enabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool,0> echoVar {
        NVS_KEY(NvsKeys::Console::Echo),"echo","console",ConfigType::Bool,
        &cfgData.echo,ConfigPersistence::Persistent,0
    };

    void processLine_();
};
