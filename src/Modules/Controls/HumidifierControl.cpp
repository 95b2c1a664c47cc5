/**
 * @file HumidifierControl.cpp
 * @brief Deterministic humidifier target and state helpers implementation.
 */

#include "Modules/Controls/HumidifierControl.h"
#include "Modules/Device/DeviceStatus.h"
#include <string.h>

int32_t roundToHumidityStep(int32_t value, uint8_t step)
{
    if (step <= 1) return value;
    const int32_t s = (int32_t)step;

    int32_t q = value / s;
    int32_t r = value % s;
    if (r < 0) {
        r += s;
        q -= 1;
    }

    const int32_t twice = 2 * r;
    if (twice > s || (twice == s && (q % 2) != 0)) q += 1;
    return q * s;
}

int32_t computeTargetHumidity(const HumidifierTargetInput& in, const HumidifierProfile& p)
{
    const int32_t step = p.step == 0 ? 1 : (int32_t)p.step;

    int32_t humidity = in.requested;
    if (in.hasCurrentTarget) {
        if (humidity == in.currentTarget + 1) humidity = in.currentTarget + step;
        else if (humidity == in.currentTarget - 1) humidity = in.currentTarget - step;
    }

    int32_t target = roundToHumidityStep(humidity, (uint8_t)step);
    if (target < (int32_t)p.minHumidity) target = p.minHumidity;
    if (target > (int32_t)p.maxHumidity) target = p.maxHumidity;
    return target;
}

HumidifierAction humidifierAction(const DeviceStatus& status, const HumidifierProfile& p)
{
    char fn[16];
    if (!status.getText(p.functionKey, fn, sizeof(fn))) return HumidifierAction::Idle;
    return strcmp(fn, p.functionHumidifying) == 0 ? HumidifierAction::Humidifying : HumidifierAction::Idle;
}

bool readHumidifierReport(const DeviceStatus& status, const HumidifierProfile& p, HumidifierReport& out)
{
    out = HumidifierReport{};
    if (status.empty()) return false;
    out.action = humidifierAction(status, p);
    out.hasHumidity = status.getInt(p.humidityKey, out.humidity);
    out.hasTarget = status.getInt(p.targetKey, out.target);
    return true;
}

const char* humidifierActionStr(HumidifierAction a)
{
    return a == HumidifierAction::Humidifying ? "humidifying" : "idle";
}
