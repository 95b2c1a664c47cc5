#pragma once
/**
 * @file ControlProfiles.h
 * @brief Per-model capability table for the control surfaces.
 */

#include <stddef.h>
#include <stdint.h>
#include <string.h>

/** @brief One resettable filter: status key and the key holding its nominal lifetime. */
struct FilterProfile {
    const char* key;
    const char* totalKey;
    const char* label;
};

/** @brief Humidifier attribute layout and limits. */
struct HumidifierProfile {
    const char* targetKey;
    const char* humidityKey;
    const char* powerKey;
    const char* powerOn;
    const char* functionKey;
    const char* functionHumidifying;
    const char* functionIdle;
    uint8_t minHumidity;
    uint8_t maxHumidity;
    uint8_t step;
    bool switchable;
};

constexpr uint8_t CONTROL_PROFILE_MAX_FILTERS = 4;

/** @brief Capabilities supported by one device model. */
struct ControlProfile {
    const char* model;
    FilterProfile filters[CONTROL_PROFILE_MAX_FILTERS];
    uint8_t filterCount;
    const HumidifierProfile* humidifier;
};

namespace ControlDefaults {

constexpr FilterProfile PreFilter    { "fltsts0",  "flttotal0",  "pre_filter" };
constexpr FilterProfile HepaFilter   { "fltsts1",  "flttotal1",  "hepa_filter" };
constexpr FilterProfile CarbonFilter { "fltsts2",  "flttotal2",  "active_carbon_filter" };
constexpr FilterProfile WickFilter   { "wicksts",  "wicktotal",  "wick" };

constexpr HumidifierProfile Humidifier2000 {
    "rhset", "rh", "pwr", "1", "func", "PH", "P", 40, 70, 10, true
};

}  // namespace ControlDefaults

static const ControlProfile CONTROL_PROFILES[] = {
    { "AC2729",
      { ControlDefaults::PreFilter, ControlDefaults::HepaFilter,
        ControlDefaults::CarbonFilter, ControlDefaults::WickFilter },
      4, &ControlDefaults::Humidifier2000 },
    { "AC3829",
      { ControlDefaults::PreFilter, ControlDefaults::HepaFilter,
        ControlDefaults::CarbonFilter, ControlDefaults::WickFilter },
      4, &ControlDefaults::Humidifier2000 },
    { "AC2889",
      { ControlDefaults::PreFilter, ControlDefaults::HepaFilter,
        ControlDefaults::CarbonFilter },
      3, nullptr },
};

static constexpr size_t CONTROL_PROFILE_COUNT = sizeof(CONTROL_PROFILES) / sizeof(CONTROL_PROFILES[0]);

static inline const ControlProfile* findControlProfile(const char* model)
{
    if (!model || model[0] == '\0') return nullptr;
    for (size_t i = 0; i < CONTROL_PROFILE_COUNT; ++i) {
        if (strcmp(CONTROL_PROFILES[i].model, model) == 0) return &CONTROL_PROFILES[i];
    }
    return nullptr;
}

static inline const FilterProfile* findFilterProfile(const ControlProfile& p, const char* key)
{
    if (!key) return nullptr;
    for (uint8_t i = 0; i < p.filterCount && i < CONTROL_PROFILE_MAX_FILTERS; ++i) {
        if (p.filters[i].key && strcmp(p.filters[i].key, key) == 0) return &p.filters[i];
    }
    return nullptr;
}
