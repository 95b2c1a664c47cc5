#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[32];
};

/** @brief Payload for DeviceLinkReady / DeviceLinkLost / DeviceReconnected. */
struct DeviceLinkPayload {
    uint8_t state;          // DeviceCoordinator::State
    uint32_t maxAgeS;       // last advertised max-age
    uint32_t reconnects;    // completed reconnects since boot
};

/** @brief Payload for DeviceStatusUpdated events. */
struct DeviceStatusUpdatedPayload {
    uint32_t seq;           // listener notifications since boot
};
