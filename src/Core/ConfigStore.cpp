/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

static void putMetaValue(JsonObject obj, const ConfigMeta& m) {
    if (!m.name || !m.valuePtr) return;
    switch (m.type) {
        case ConfigType::Int32:     obj[m.name] = *(const int32_t*)m.valuePtr; break;
        case ConfigType::UInt8:     obj[m.name] = *(const uint8_t*)m.valuePtr; break;
        case ConfigType::UInt32:    obj[m.name] = *(const uint32_t*)m.valuePtr; break;
        case ConfigType::Bool:      obj[m.name] = *(const bool*)m.valuePtr; break;
        case ConfigType::CharArray: obj[m.name] = (const char*)m.valuePtr; break;
    }
}

void ConfigStore::notifyChanged(const char* nvsKey)
{
    if (!_eventBus || !nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);
    p.nvsKey[sizeof(p.nvsKey) - 1] = '\0';

    _eventBus->post(EventId::ConfigChanged, &p, sizeof(p));
}

void ConfigStore::recordNvsWrite_(size_t bytesWritten)
{
    if (bytesWritten == 0) {
        Log::warn(LOG_TAG_CORE, "NVS write failed");
        return;
    }
    _nvsWriteTotal.fetch_add(1U, std::memory_order_relaxed);
}

void ConfigStore::putInt_(const char* key, int32_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putInt(key, value));
}

void ConfigStore::putUChar_(const char* key, uint8_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putUChar(key, value));
}

void ConfigStore::putUInt_(const char* key, uint32_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putUInt(key, value));
}

void ConfigStore::putBool_(const char* key, bool value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putBool(key, value));
}

void ConfigStore::putString_(const char* key, const char* value)
{
    if (!_prefs || !key || !value) return;
    // Empty strings are legal values but putString() reports 0 bytes for them.
    if (value[0] == '\0') {
        _prefs->putString(key, value);
        return;
    }
    recordNvsWrite_(_prefs->putString(key, value));
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    switch (m.type) {
        case ConfigType::Int32:
            putInt_(m.nvsKey, *(int32_t*)m.valuePtr);
            return true;
        case ConfigType::UInt8:
            putUChar_(m.nvsKey, *(uint8_t*)m.valuePtr);
            return true;
        case ConfigType::UInt32:
            putUInt_(m.nvsKey, *(uint32_t*)m.valuePtr);
            return true;
        case ConfigType::Bool:
            putBool_(m.nvsKey, *(bool*)m.valuePtr);
            return true;
        case ConfigType::CharArray:
            putString_(m.nvsKey, (const char*)m.valuePtr);
            return true;
    }
    return false;
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey || !_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::UInt32:
                *(uint32_t*)m.valuePtr = _prefs->getUInt(m.nvsKey, *(uint32_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
    }
}

void ConfigStore::savePersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "savePersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        writePersistent(_meta[i]);
    }
}

bool ConfigStore::erasePersistent()
{
    if (!_prefs) return false;
    Log::warn(LOG_TAG_CORE, "erasing persistent config");
    return _prefs->clear();
}

ConfigMeta* ConfigStore::find(const char* module, const char* jsonName)
{
    if (!module || !jsonName) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].module, module) && strEquals(_meta[i].name, jsonName)) return &_meta[i];
    }
    return nullptr;
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    JsonObject root = doc.to<JsonObject>();

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module) continue;
        JsonObject modObj = root[m.module];
        if (modObj.isNull()) modObj = root.createNestedObject(m.module);
        putMetaValue(modObj, m);
    }

    if (doc.overflowed()) {
        Log::warn(LOG_TAG_CORE, "toJson: document overflow");
    }
    const size_t need = measureJson(doc);
    if (need >= outLen) {
        out[0] = '\0';
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    JsonObject obj = doc.to<JsonObject>();

    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!strEquals(m.module, module)) continue;
        putMetaValue(obj, m);
        any = true;
    }
    if (!any) return false;

    if (measureJson(doc) >= outLen || doc.overflowed()) {
        if (truncated) *truncated = true;
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::assignFromJson_(ConfigMeta& m, JsonVariantConst v, bool& changed)
{
    changed = false;
    switch (m.type) {
    case ConfigType::Int32: {
        if (!v.is<int32_t>()) return false;
        int32_t x = v.as<int32_t>();
        if (*(int32_t*)m.valuePtr != x) { *(int32_t*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::UInt8: {
        if (!v.is<uint8_t>()) return false;
        uint8_t x = v.as<uint8_t>();
        if (*(uint8_t*)m.valuePtr != x) { *(uint8_t*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::UInt32: {
        if (!v.is<uint32_t>()) return false;
        uint32_t x = v.as<uint32_t>();
        if (*(uint32_t*)m.valuePtr != x) { *(uint32_t*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::Bool: {
        if (!v.is<bool>()) return false;
        bool x = v.as<bool>();
        if (*(bool*)m.valuePtr != x) { *(bool*)m.valuePtr = x; changed = true; }
        return true;
    }
    case ConfigType::CharArray: {
        if (!v.is<const char*>() || m.size == 0) return false;
        const char* s = v.as<const char*>();
        size_t len = strlen(s);
        if (len >= m.size) return false;
        char* dst = (char*)m.valuePtr;
        if (strcmp(dst, s) != 0) {
            memcpy(dst, s, len + 1);
            changed = true;
        }
        return true;
    }
    }
    return false;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        Log::warn(LOG_TAG_CORE, "applyJson: parse failed (%s)", err.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) return false;
    return applyJson(doc.as<JsonObjectConst>());
}

bool ConfigStore::applyJson(JsonObjectConst root)
{
    if (root.isNull()) return false;

    bool allOk = true;
    for (JsonPairConst modKv : root) {
        JsonObjectConst modObj = modKv.value().as<JsonObjectConst>();
        if (modObj.isNull()) {
            allOk = false;
            continue;
        }

        for (JsonPairConst kv : modObj) {
            ConfigMeta* m = find(modKv.key().c_str(), kv.key().c_str());
            if (!m) {
                Log::debug(LOG_TAG_CORE, "applyJson: unknown %s.%s", modKv.key().c_str(), kv.key().c_str());
                continue;
            }

            bool changed = false;
            if (!assignFromJson_(*m, kv.value(), changed)) {
                Log::warn(LOG_TAG_CORE, "applyJson: bad value for %s.%s", m->module, m->name);
                allOk = false;
                continue;
            }
            if (!changed) continue;

            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m->module, m->name);
            writePersistent(*m);
            notifyChanged(m->nvsKey);
        }
    }
    return allOk;
}

bool ConfigStore::runMigrations(uint32_t currentVersion,
                                const MigrationStep* steps,
                                size_t count,
                                const char* versionKey,
                                bool clearOnFail)
{
    if (!_prefs) return false;
    if (!versionKey) versionKey = "cfg_ver";

    uint32_t storedVersion = _prefs->getUInt(versionKey, 0);
    Log::debug(LOG_TAG_CORE, "migrations: stored=%lu current=%lu",
               (unsigned long)storedVersion, (unsigned long)currentVersion);

    if (storedVersion == currentVersion) return true;

    // Firmware downgrade: keep the newer layout untouched.
    if (storedVersion > currentVersion) {
        Log::warn(LOG_TAG_CORE, "config version %lu is newer than firmware (%lu)",
                  (unsigned long)storedVersion, (unsigned long)currentVersion);
        return false;
    }

    while (storedVersion < currentVersion) {
        const MigrationStep* step = nullptr;
        for (size_t i = 0; steps && i < count; ++i) {
            if (steps[i].fromVersion == storedVersion) { step = &steps[i]; break; }
        }

        if (!step || !step->apply || !step->apply(*_prefs, clearOnFail)) {
            Log::warn(LOG_TAG_CORE, "migration failed from %lu", (unsigned long)storedVersion);
            if (clearOnFail) {
                _prefs->clear();
                putUInt_(versionKey, currentVersion);
            }
            return false;
        }

        storedVersion = step->toVersion;
        putUInt_(versionKey, storedVersion);
        Log::debug(LOG_TAG_CORE, "migration applied: now=%lu", (unsigned long)storedVersion);
    }

    Log::info(LOG_TAG_CORE, "migrations: completed at %lu", (unsigned long)currentVersion);
    return true;
}
