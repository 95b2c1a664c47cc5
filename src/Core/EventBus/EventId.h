#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // Configuration
    ConfigChanged = 100,

    // Device link
    DeviceLinkReady = 200,
    DeviceLinkLost = 201,
    DeviceReconnected = 202,
    DeviceStatusUpdated = 210,
};
