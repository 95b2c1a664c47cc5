#pragma once
/**
 * @file IDeviceClient.h
 * @brief Capability interface to one device connection.
 */
#include <ArduinoJson.h>
#include <memory>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Modules/Device/DeviceStatus.h"

/** @brief Outcome of one bounded draw from a status stream. */
enum class StreamResult : uint8_t {
    Update,   ///< out holds the next pushed status
    Timeout,  ///< nothing within waitMs, stream still alive
    Ended,    ///< device or client closed the sequence
    Failed    ///< transport error, sequence is dead
};

/**
 * @brief Observation sequence of pushed status updates.
 *
 * next() never blocks longer than waitMs so the owner can check for
 * cancellation between draws.
 */
class IStatusStream {
public:
    virtual ~IStatusStream() = default;
    virtual StreamResult next(DeviceStatus& out, uint32_t waitMs) = 0;
};

/**
 * @brief Request/response + observe access to the device.
 *
 * All calls may block on I/O. Failures are reported through the return
 * value and the optional ErrorCode.
 */
class IDeviceClient {
public:
    virtual ~IDeviceClient() = default;

    /** @brief Fetch status once; maxAgeS receives the device's advertised polling interval. */
    virtual bool fetchStatus(DeviceStatus& out, uint32_t& maxAgeS, ErrorCode* err) = 0;
    /** @brief Open an observation sequence, or nullptr on failure. */
    virtual std::unique_ptr<IStatusStream> observeStatus(ErrorCode* err) = 0;
    /** @brief Write one control attribute. */
    virtual bool setControlValue(const char* key, JsonVariantConst value, ErrorCode* err) = 0;
    /** @brief Write several control attributes in one request. */
    virtual bool setControlValues(JsonObjectConst values, ErrorCode* err) = 0;
    /** @brief Close the connection. Later calls fail with ClientClosed. */
    virtual bool close(ErrorCode* err) = 0;
};

/** @brief Opens clients against a host. */
class IDeviceClientFactory {
public:
    virtual ~IDeviceClientFactory() = default;
    virtual std::shared_ptr<IDeviceClient> open(const char* host, ErrorCode* err) = 0;
};
