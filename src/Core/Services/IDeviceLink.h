#pragma once
/**
 * @file IDeviceLink.h
 * @brief Device link service interface.
 */
#include <stdint.h>
#include <stddef.h>
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"

class DeviceStatus;

/** @brief Listener signature; return false to report a fault. */
typedef bool (*DeviceListenerFn)(void* ctx);

/** @brief Service interface exposed by the device link module ("device"). */
struct DeviceLinkService {
    /** @brief True once the first refresh succeeded. */
    bool (*isReady)(void* ctx);
    /** @brief DeviceCoordinator::State as integer. */
    uint8_t (*state)(void* ctx);
    /** @brief Copy the cached status; false while absent. */
    bool (*copyStatus)(void* ctx, DeviceStatus& out);
    /** @brief Copy the configured model id. */
    bool (*model)(void* ctx, char* out, size_t outLen);
    bool (*addListener)(void* ctx, DeviceListenerFn fn, void* fnCtx);
    bool (*removeListener)(void* ctx, DeviceListenerFn fn, void* fnCtx);
    /** @brief Write control values; on success the cache is patched and listeners run. */
    bool (*setValues)(void* ctx, JsonObjectConst values, ErrorCode* err);
    bool (*reconnect)(void* ctx);
    void* ctx;
};
