#pragma once
/**
 * @file ConfigMigrations.h
 * @brief Config migration steps for ConfigStore.
 */
#include <Preferences.h>
#include "Core/ConfigStore.h"
#include "Core/NvsKeys.h"

/** @brief Current configuration schema version. */
constexpr uint32_t CURRENT_CFG_VERSION = 1;

/** @brief Migration step from an unversioned namespace to version 1. */
static bool mig_0_to_1(Preferences& prefs, bool clearOnFail)
{
    (void)clearOnFail;
    // Unversioned layouts may hold a host without the enable flag: keep the link on.
    if (prefs.isKey(NvsKeys::Device::Host) && !prefs.isKey(NvsKeys::Device::Enabled)) {
        return prefs.putBool(NvsKeys::Device::Enabled, true) > 0;
    }
    return true;
}

/** @brief Ordered list of migrations. */
static const MigrationStep steps[] = {
    {0, 1, mig_0_to_1}
};

/** @brief Number of migration steps. */
static constexpr size_t MIGRATION_COUNT = sizeof(steps) / sizeof(steps[0]);
