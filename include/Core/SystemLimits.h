#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = 2048;
/** @brief Config JSON export buffer length used by `config.get`. */
constexpr size_t ConfigExportBuf = 1024;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 16;

/** @brief Device link (coordinator, client, status cache) limits. */
namespace Device {

/** @brief Maximum serialized size of one device status object (`DeviceStatus`). */
constexpr size_t StatusJsonMax = 1024;
/** @brief ArduinoJson capacity used to parse one status object. */
constexpr size_t StatusDocCapacity = 1536;
/** @brief ArduinoJson capacity used to parse a control values object. */
constexpr size_t ControlDocCapacity = 384;
/** @brief Maximum device host length (`DeviceLinkConfig::host`). */
constexpr size_t Host = 64;
/** @brief Maximum device identifier length (`DeviceLinkConfig::deviceId`). */
constexpr size_t DeviceId = 24;
/** @brief Maximum model identifier length (`DeviceLinkConfig::model`). */
constexpr size_t Model = 16;
/** @brief Maximum attribute key length accepted by control helpers. */
constexpr size_t KeyMax = 24;
/** @brief Maximum number of listeners registered on one `DeviceCoordinator`. */
constexpr uint8_t MaxListeners = 8;
/** @brief Missed pushes tolerated before the watchdog triggers a reconnect. */
constexpr uint32_t MissedPackageCount = 3;
/** @brief Polling interval assumed before the device reports its own (seconds). */
constexpr uint32_t DefaultMaxAgeS = 60;
/** @brief Stream wait slice in ms; bounds how long a cancelled observation task lingers. */
constexpr uint32_t StreamWaitSliceMs = 250;
/** @brief Interval between warnings while the destructor waits for owned tasks (the wait itself is unbounded). */
constexpr uint32_t TaskJoinWarnMs = 3000;
/** @brief Reconnect tasks alive at once: the current attempt plus one superseded straggler. */
constexpr uint8_t MaxReconnectTasks = 2;

/** @brief FreeRTOS task parameters for coordinator-owned tasks. */
namespace Task {
constexpr uint16_t ObserveStack = 6144;
constexpr uint16_t ReconnectStack = 4096;
constexpr uint8_t ObservePriority = 2;
constexpr uint8_t ReconnectPriority = 2;
}  // namespace Task

/** @brief First-refresh retry policy used by `DeviceLinkModule::loop`. */
namespace Backoff {
/** @brief Initial retry delay in ms after a failed first refresh. */
constexpr uint32_t MinMs = 2000;
/** @brief Maximum retry delay in ms. */
constexpr uint32_t MaxMs = 60000;
/** @brief Random jitter percentage applied to the retry delay. */
constexpr uint8_t JitterPct = 20;
}  // namespace Backoff

}  // namespace Device

/** @brief Serial console limits (`ConsoleModule`). */
namespace Console {
/** @brief Maximum accepted command line length. */
constexpr size_t LineBuf = 384;
/** @brief JSON capacity for one console command document. */
constexpr size_t JsonCmdBuf = 512;
/** @brief Serialized args buffer forwarded to command handlers. */
constexpr size_t ArgsBuf = 320;
/** @brief Command name buffer length. */
constexpr size_t CmdName = 32;
/** @brief Reply buffer length for command handlers. */
constexpr size_t Reply = 1536;
}  // namespace Console

}  // namespace Limits
