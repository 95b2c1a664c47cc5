#pragma once
/**
 * @file DeviceStatus.h
 * @brief Bounded, replace-on-update snapshot of the device status record.
 */
#include <ArduinoJson.h>
#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"

/** @brief Parse document sized for one status object. */
using StatusDocument = StaticJsonDocument<Limits::Device::StatusDocCapacity>;

/**
 * @brief Opaque attribute-key to value mapping, stored as compact JSON object text.
 *
 * A DeviceStatus is either empty (absent) or holds one valid JSON object.
 * Values are replaced wholesale; patched() builds a new instance and never
 * edits the source.
 */
class DeviceStatus {
public:
    DeviceStatus() { clear(); }

    /** @brief Replace content with a JSON object text. Content is unchanged on failure. */
    bool assign(const char* json, ErrorCode* err = nullptr);
    /** @brief Replace content with a serialized JSON object. */
    bool assign(JsonObjectConst obj, ErrorCode* err = nullptr);
    /** @brief Drop content (status becomes absent). */
    void clear();

    bool empty() const { return len_ == 0; }
    const char* json() const { return buf_; }
    size_t length() const { return len_; }

    /** @brief Deserialize into a caller-provided document. */
    bool parse(StatusDocument& doc) const;

    /** @brief True when the attribute key exists. */
    bool has(const char* key) const;
    /** @brief Read an integer attribute; numeric strings ("45") are accepted. */
    bool getInt(const char* key, int32_t& out) const;
    /** @brief Read an attribute rendered as text (strings verbatim, numbers formatted). */
    bool getText(const char* key, char* out, size_t outLen) const;

    /**
     * @brief Build a copy of base with the patch keys overwritten.
     *
     * An empty base acts as {}. Fails with StatusTooLarge when the merged
     * object does not fit.
     */
    static bool patched(const DeviceStatus& base, JsonObjectConst patch, DeviceStatus& out,
                        ErrorCode* err = nullptr);

    bool operator==(const DeviceStatus& other) const;
    bool operator!=(const DeviceStatus& other) const { return !(*this == other); }

    /** @brief Typed helpers on an already parsed object. */
    static bool readInt(JsonObjectConst obj, const char* key, int32_t& out);
    static bool readText(JsonObjectConst obj, const char* key, char* out, size_t outLen);

private:
    char buf_[Limits::Device::StatusJsonMax];
    size_t len_ = 0;
};
