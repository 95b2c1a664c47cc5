#pragma once
/**
 * @file HumidifierControl.h
 * @brief Deterministic humidifier target and state helpers.
 */

#include <stdint.h>

#include "Domain/ControlProfiles.h"

class DeviceStatus;

enum class HumidifierAction : uint8_t { Idle = 0, Humidifying = 1 };

struct HumidifierTargetInput {
    int32_t requested = 0;
    int32_t currentTarget = 0;
    bool hasCurrentTarget = false;
};

/** @brief Humidifier view read from the cached status. */
struct HumidifierReport {
    HumidifierAction action = HumidifierAction::Idle;
    bool hasHumidity = false;
    int32_t humidity = 0;
    bool hasTarget = false;
    int32_t target = 0;
};

/** @brief Round to the nearest multiple of step; ties go to the even multiple. */
int32_t roundToHumidityStep(int32_t value, uint8_t step);

/**
 * @brief Target to send for a requested humidity.
 *
 * A request one above/below the current target is a +/- nudge and moves a
 * full step. The result sits on the step grid inside [min,max].
 */
int32_t computeTargetHumidity(const HumidifierTargetInput& in, const HumidifierProfile& p);

HumidifierAction humidifierAction(const DeviceStatus& status, const HumidifierProfile& p);
inline bool humidifierIsOn(const DeviceStatus& status, const HumidifierProfile& p)
{
    return humidifierAction(status, p) == HumidifierAction::Humidifying;
}

bool readHumidifierReport(const DeviceStatus& status, const HumidifierProfile& p, HumidifierReport& out);

const char* humidifierActionStr(HumidifierAction a);
