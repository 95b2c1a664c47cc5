#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/** @brief Serial sink configuration. */
struct LogSerialConfig {
    bool color = true;
};

/**
 * @brief Passive module that writes log entries to Serial.
 *
 * Line format: `[timestamp][L][tag] msg`, colored by level. The timestamp is
 * wall-clock time once the system clock is set, uptime before. Colors can
 * be turned off for plain terminals (`log.color`).
 */
class LogSerialSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.sink.serial"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register the serial log sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static void write(void* ctx, const LogEntry& e);

    LogSerialConfig cfgData;
    ConfigVariable<bool,0> colorVar {
        NVS_KEY(NvsKeys::Log::Color),"color","log",ConfigType::Bool,
        &cfgData.color,ConfigPersistence::Persistent,0
    };
};
