#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// ConfigStore integrates with the EventBus:
// - When a config value changes (set() or applyJson()), it posts an
//   EventId::ConfigChanged event carrying the NVS key.
//
// Design goals (ESP32):
// - no heap allocations in normal runtime path
// - post() to EventBus is thread-safe (queue-based EventBus)

#include <Preferences.h>
#include <ArduinoJson.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/** @brief Defines a configuration migration step between versions. */
struct MigrationStep {
    uint32_t fromVersion;
    uint32_t toVersion;
    bool (*apply)(Preferences& prefs, bool clearOnFail);
};

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 *
 * JSON layout is grouped by module: {"device":{"host":"..."},"console":{...}}.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    /** @brief Inject EventBus dependency for change notifications. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();
    /** @brief Save persistent values from registered variables into NVS. */
    void savePersistent();
    /** @brief Remove every key of the storage namespace (factory reset). */
    bool erasePersistent();

    /** @brief Serialize all registered config to JSON, grouped by module. */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply a JSON patch to registered config variables.
     * @return false if the text is not a JSON object or a value has the wrong type.
     */
    bool applyJson(const char* json);
    /** @brief Apply a JSON object patch; unknown modules and keys are ignored. */
    bool applyJson(JsonObjectConst root);

    /** @brief Run config migrations using a version key in NVS. */
    bool runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                       const char* versionKey = "cfg_ver", bool clearOnFail = true);

    /** @brief Total NVS writes since boot. */
    uint32_t nvsWriteCount() const { return _nvsWriteTotal.load(std::memory_order_relaxed); }

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS];
    uint16_t _metaCount = 0;

    void notifyChanged(const char* nvsKey);
    bool writePersistent(const ConfigMeta& m);
    bool assignFromJson_(ConfigMeta& m, JsonVariantConst v, bool& changed);
    void recordNvsWrite_(size_t bytesWritten);
    void putInt_(const char* key, int32_t value);
    void putUChar_(const char* key, uint8_t value);
    void putUInt_(const char* key, uint32_t value);
    void putBool_(const char* key, bool value);
    void putString_(const char* key, const char* value);

    ConfigMeta* find(const char* module, const char* jsonName);

    std::atomic<uint32_t> _nvsWriteTotal{0};
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::warn(LOG_TAG_CORE, "config table full, dropping %s", var.jsonName ? var.jsonName : "?");
        return false;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn(LOG_TAG_CORE, "NVS key too long (%s)", var.nvsKey);
        return false;
    }

    ConfigMeta& m = _meta[_metaCount++];

    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for char arrays");
    if (!var.value) return false;
    if (*(var.value) == value) return true;
    *(var.value) = value;

    var.notify();

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        switch (var.type) {
        case ConfigType::Int32:  putInt_(var.nvsKey, (int32_t)*var.value); break;
        case ConfigType::UInt8:  putUChar_(var.nvsKey, (uint8_t)*var.value); break;
        case ConfigType::UInt32: putUInt_(var.nvsKey, (uint32_t)*var.value); break;
        case ConfigType::Bool:   putBool_(var.nvsKey, (bool)*var.value); break;
        default: break;
        }
    }

    notifyChanged(var.nvsKey);
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;
    memcpy(var.value, str, len);
    var.value[len] = '\0';

    var.notify();

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        putString_(var.nvsKey, var.value);
    }

    notifyChanged(var.nvsKey);
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
