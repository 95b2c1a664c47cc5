#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "airlink"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Config schema version key read/written by `ConfigStore::runMigrations`. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker used to select and run config migrations.

namespace Device {
constexpr char Enabled[] = "dev_en"; // Device link persisted key for field `dev_en`.
constexpr char Host[] = "dev_host"; // Device link persisted key for field `dev_host`.
constexpr char DeviceId[] = "dev_id"; // Device link persisted key for field `dev_id`.
constexpr char Model[] = "dev_model"; // Device link persisted key for field `dev_model`.
}  // namespace Device

namespace Log {
constexpr char Level[] = "log_lvl"; // Log dispatcher persisted key for field `log_lvl`.
constexpr char Color[] = "log_color"; // Serial log sink persisted key for field `log_color`.
}  // namespace Log

namespace Console {
constexpr char Enabled[] = "con_en"; // Console module persisted key for field `con_en`.
constexpr char Echo[] = "con_echo"; // Console module persisted key for field `con_echo`.
}  // namespace Console

}  // namespace NvsKeys
