#include <unity.h>

#include "Domain/ControlProfiles.h"
#include "Modules/Controls/HumidifierControl.h"
#include "Modules/Device/DeviceStatus.h"

static const HumidifierProfile& profile()
{
    return ControlDefaults::Humidifier2000;
}

void test_round_to_step_ties_go_to_even_multiple()
{
    TEST_ASSERT_EQUAL_INT32(40, roundToHumidityStep(44, 10));
    TEST_ASSERT_EQUAL_INT32(50, roundToHumidityStep(46, 10));
    TEST_ASSERT_EQUAL_INT32(40, roundToHumidityStep(45, 10));
    TEST_ASSERT_EQUAL_INT32(60, roundToHumidityStep(55, 10));
    TEST_ASSERT_EQUAL_INT32(60, roundToHumidityStep(65, 10));
    TEST_ASSERT_EQUAL_INT32(80, roundToHumidityStep(75, 10));
    TEST_ASSERT_EQUAL_INT32(47, roundToHumidityStep(47, 1));
}

void test_plus_one_nudge_moves_a_full_step()
{
    HumidifierTargetInput in{};
    in.currentTarget = 50;
    in.hasCurrentTarget = true;

    in.requested = 51;
    TEST_ASSERT_EQUAL_INT32(60, computeTargetHumidity(in, profile()));
    in.requested = 49;
    TEST_ASSERT_EQUAL_INT32(40, computeTargetHumidity(in, profile()));
}

void test_nudge_ignored_without_current_target()
{
    HumidifierTargetInput in{};
    in.requested = 51;
    in.currentTarget = 50;
    in.hasCurrentTarget = false;
    TEST_ASSERT_EQUAL_INT32(50, computeTargetHumidity(in, profile()));
}

void test_target_clamped_to_profile_range()
{
    HumidifierTargetInput in{};
    in.requested = 20;
    TEST_ASSERT_EQUAL_INT32(40, computeTargetHumidity(in, profile()));
    in.requested = 95;
    TEST_ASSERT_EQUAL_INT32(70, computeTargetHumidity(in, profile()));

    // 70 + nudge = 80, clamped back to the max.
    in.currentTarget = 70;
    in.hasCurrentTarget = true;
    in.requested = 71;
    TEST_ASSERT_EQUAL_INT32(70, computeTargetHumidity(in, profile()));
}

void test_profile_lookup_by_model()
{
    const ControlProfile* p = findControlProfile("AC2729");
    TEST_ASSERT_NOT_NULL(p);
    TEST_ASSERT_NOT_NULL(p->humidifier);
    TEST_ASSERT_EQUAL_UINT8(4, p->filterCount);

    const ControlProfile* noHum = findControlProfile("AC2889");
    TEST_ASSERT_NOT_NULL(noHum);
    TEST_ASSERT_NULL(noHum->humidifier);
    TEST_ASSERT_NULL(findFilterProfile(*noHum, "wicksts"));

    TEST_ASSERT_NULL(findControlProfile("AC9999"));
    TEST_ASSERT_NULL(findControlProfile(""));
    TEST_ASSERT_NULL(findControlProfile(nullptr));
}

void test_filter_lookup_returns_total_key()
{
    const ControlProfile* p = findControlProfile("AC2729");
    TEST_ASSERT_NOT_NULL(p);
    const FilterProfile* f = findFilterProfile(*p, "fltsts1");
    TEST_ASSERT_NOT_NULL(f);
    TEST_ASSERT_EQUAL_STRING("flttotal1", f->totalKey);
    TEST_ASSERT_NULL(findFilterProfile(*p, "fltsts9"));
}

void test_action_follows_function_attribute()
{
    DeviceStatus st;
    TEST_ASSERT_EQUAL_INT((int)HumidifierAction::Idle, (int)humidifierAction(st, profile()));

    TEST_ASSERT_TRUE(st.assign("{\"pwr\":\"1\",\"func\":\"PH\"}"));
    TEST_ASSERT_EQUAL_INT((int)HumidifierAction::Humidifying, (int)humidifierAction(st, profile()));
    TEST_ASSERT_TRUE(humidifierIsOn(st, profile()));

    TEST_ASSERT_TRUE(st.assign("{\"pwr\":\"1\",\"func\":\"P\"}"));
    TEST_ASSERT_FALSE(humidifierIsOn(st, profile()));
    TEST_ASSERT_EQUAL_STRING("idle", humidifierActionStr(humidifierAction(st, profile())));
}

void test_report_reads_humidity_and_target()
{
    DeviceStatus st;
    HumidifierReport rep;
    TEST_ASSERT_FALSE(readHumidifierReport(st, profile(), rep));

    TEST_ASSERT_TRUE(st.assign("{\"func\":\"PH\",\"rh\":42,\"rhset\":\"50\"}"));
    TEST_ASSERT_TRUE(readHumidifierReport(st, profile(), rep));
    TEST_ASSERT_EQUAL_INT((int)HumidifierAction::Humidifying, (int)rep.action);
    TEST_ASSERT_TRUE(rep.hasHumidity);
    TEST_ASSERT_EQUAL_INT32(42, rep.humidity);
    TEST_ASSERT_TRUE(rep.hasTarget);
    TEST_ASSERT_EQUAL_INT32(50, rep.target);
    TEST_ASSERT_EQUAL_STRING("humidifying", humidifierActionStr(rep.action));

    TEST_ASSERT_TRUE(st.assign("{\"func\":\"P\"}"));
    TEST_ASSERT_TRUE(readHumidifierReport(st, profile(), rep));
    TEST_ASSERT_FALSE(rep.hasHumidity);
    TEST_ASSERT_FALSE(rep.hasTarget);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_round_to_step_ties_go_to_even_multiple);
    RUN_TEST(test_plus_one_nudge_moves_a_full_step);
    RUN_TEST(test_nudge_ignored_without_current_target);
    RUN_TEST(test_target_clamped_to_profile_range);
    RUN_TEST(test_profile_lookup_by_model);
    RUN_TEST(test_filter_lookup_returns_total_key);
    RUN_TEST(test_action_follows_function_attribute);
    RUN_TEST(test_report_reads_humidity_and_target);
    return UNITY_END();
}
