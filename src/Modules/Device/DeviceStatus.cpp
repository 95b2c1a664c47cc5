/**
 * @file DeviceStatus.cpp
 * @brief Implementation file.
 */
#include "DeviceStatus.h"
#include <errno.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

void DeviceStatus::clear()
{
    buf_[0] = '\0';
    len_ = 0;
}

bool DeviceStatus::assign(const char* json, ErrorCode* err)
{
    if (!json) {
        setError(err, ErrorCode::BadStatusJson);
        return false;
    }

    StatusDocument doc;
    if (deserializeJson(doc, json) != DeserializationError::Ok || !doc.is<JsonObject>()) {
        setError(err, ErrorCode::BadStatusJson);
        return false;
    }
    // Re-serialize so the stored text is always compact and canonical.
    return assign(doc.as<JsonObjectConst>(), err);
}

bool DeviceStatus::assign(JsonObjectConst obj, ErrorCode* err)
{
    if (obj.isNull()) {
        setError(err, ErrorCode::BadStatusJson);
        return false;
    }
    const size_t need = measureJson(obj);
    if (need >= sizeof(buf_)) {
        setError(err, ErrorCode::StatusTooLarge);
        return false;
    }
    len_ = serializeJson(obj, buf_, sizeof(buf_));
    return true;
}

bool DeviceStatus::parse(StatusDocument& doc) const
{
    doc.clear();
    if (empty()) {
        doc.to<JsonObject>();
        return true;
    }
    return deserializeJson(doc, buf_, len_) == DeserializationError::Ok && doc.is<JsonObject>();
}

bool DeviceStatus::has(const char* key) const
{
    if (!key || empty()) return false;
    StatusDocument doc;
    if (!parse(doc)) return false;
    return doc.as<JsonObjectConst>().containsKey(key);
}

bool DeviceStatus::getInt(const char* key, int32_t& out) const
{
    StatusDocument doc;
    if (!key || !parse(doc)) return false;
    return readInt(doc.as<JsonObjectConst>(), key, out);
}

bool DeviceStatus::getText(const char* key, char* out, size_t outLen) const
{
    StatusDocument doc;
    if (!key || !parse(doc)) return false;
    return readText(doc.as<JsonObjectConst>(), key, out, outLen);
}

bool DeviceStatus::readInt(JsonObjectConst obj, const char* key, int32_t& out)
{
    if (obj.isNull() || !key) return false;
    JsonVariantConst v = obj[key];
    if (v.isNull()) return false;

    if (v.is<int32_t>()) {
        out = v.as<int32_t>();
        return true;
    }
    if (v.is<double>()) {
        // Also rejects NaN: every comparison with it is false.
        const double d = v.as<double>();
        if (!(d >= (double)INT32_MIN && d <= (double)INT32_MAX)) return false;
        out = (int32_t)d;
        return true;
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        char* end = nullptr;
        errno = 0;
        long long x = strtoll(s, &end, 10);
        if (end == s || *end != '\0' || errno == ERANGE) return false;
        if (x < INT32_MIN || x > INT32_MAX) return false;
        out = (int32_t)x;
        return true;
    }
    return false;
}

bool DeviceStatus::readText(JsonObjectConst obj, const char* key, char* out, size_t outLen)
{
    if (obj.isNull() || !key || !out || outLen == 0) return false;
    JsonVariantConst v = obj[key];
    if (v.isNull()) return false;

    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (strlen(s) >= outLen) return false;
        strcpy(out, s);
        return true;
    }
    const size_t need = measureJson(v);
    if (need >= outLen) return false;
    serializeJson(v, out, outLen);
    return true;
}

bool DeviceStatus::patched(const DeviceStatus& base, JsonObjectConst patch, DeviceStatus& out,
                           ErrorCode* err)
{
    if (patch.isNull()) {
        setError(err, ErrorCode::BadStatusJson);
        return false;
    }

    StatusDocument doc;
    if (!base.parse(doc)) {
        setError(err, ErrorCode::BadStatusJson);
        return false;
    }
    JsonObject root = doc.as<JsonObject>();
    for (JsonPairConst kv : patch) {
        if (!root[kv.key().c_str()].set(kv.value())) {
            setError(err, ErrorCode::StatusTooLarge);
            return false;
        }
    }
    if (doc.overflowed()) {
        setError(err, ErrorCode::StatusTooLarge);
        return false;
    }
    return out.assign(doc.as<JsonObjectConst>(), err);
}

bool DeviceStatus::operator==(const DeviceStatus& other) const
{
    return len_ == other.len_ && memcmp(buf_, other.buf_, len_) == 0;
}
