#include <unity.h>
#include <stdint.h>
#include <string.h>

#include "Modules/Device/DeviceStatus.h"

void test_assign_stores_compact_object()
{
    DeviceStatus st;
    TEST_ASSERT_TRUE(st.empty());
    TEST_ASSERT_TRUE(st.assign("{ \"pwr\" : \"1\", \"rh\" : 42 }"));
    TEST_ASSERT_FALSE(st.empty());
    TEST_ASSERT_EQUAL_STRING("{\"pwr\":\"1\",\"rh\":42}", st.json());
    TEST_ASSERT_EQUAL_UINT32(strlen(st.json()), st.length());
}

void test_assign_rejects_bad_json_and_keeps_content()
{
    DeviceStatus st;
    TEST_ASSERT_TRUE(st.assign("{\"rh\":42}"));

    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(st.assign("{\"rh\":", &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadStatusJson, (int)err);

    err = ErrorCode::None;
    TEST_ASSERT_FALSE(st.assign("[1,2,3]", &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadStatusJson, (int)err);

    err = ErrorCode::None;
    TEST_ASSERT_FALSE(st.assign((const char*)nullptr, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadStatusJson, (int)err);

    TEST_ASSERT_EQUAL_STRING("{\"rh\":42}", st.json());
}

void test_assign_rejects_oversized_object()
{
    static char json[1200];
    strcpy(json, "{\"blob\":\"");
    size_t n = strlen(json);
    for (size_t i = 0; i < 1100; ++i) json[n++] = 'x';
    json[n++] = '"';
    json[n++] = '}';
    json[n] = '\0';

    DeviceStatus st;
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(st.assign(json, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::StatusTooLarge, (int)err);
    TEST_ASSERT_TRUE(st.empty());
}

void test_get_int_accepts_numbers_and_numeric_strings()
{
    DeviceStatus st;
    TEST_ASSERT_TRUE(st.assign("{\"rh\":42,\"rhset\":\"50\",\"pm25\":7.9,\"func\":\"PH\",\"bad\":\"4x\"}"));

    int32_t v = 0;
    TEST_ASSERT_TRUE(st.getInt("rh", v));
    TEST_ASSERT_EQUAL_INT32(42, v);
    TEST_ASSERT_TRUE(st.getInt("rhset", v));
    TEST_ASSERT_EQUAL_INT32(50, v);
    TEST_ASSERT_TRUE(st.getInt("pm25", v));
    TEST_ASSERT_EQUAL_INT32(7, v);

    v = -1;
    TEST_ASSERT_FALSE(st.getInt("func", v));
    TEST_ASSERT_FALSE(st.getInt("bad", v));
    TEST_ASSERT_FALSE(st.getInt("missing", v));
    TEST_ASSERT_EQUAL_INT32(-1, v);
}

void test_get_int_rejects_values_outside_int32()
{
    DeviceStatus st;
    TEST_ASSERT_TRUE(st.assign("{\"big\":1e12,\"neg\":-3e10,\"wide\":99999999999,"
                               "\"text\":\"99999999999\",\"huge\":\"99999999999999999999\","
                               "\"min\":-2147483648,\"max\":\"2147483647\"}"));

    int32_t v = 5;
    TEST_ASSERT_FALSE(st.getInt("big", v));
    TEST_ASSERT_FALSE(st.getInt("neg", v));
    TEST_ASSERT_FALSE(st.getInt("wide", v));
    TEST_ASSERT_FALSE(st.getInt("text", v));
    TEST_ASSERT_FALSE(st.getInt("huge", v));
    TEST_ASSERT_EQUAL_INT32(5, v);

    TEST_ASSERT_TRUE(st.getInt("min", v));
    TEST_ASSERT_EQUAL_INT32(INT32_MIN, v);
    TEST_ASSERT_TRUE(st.getInt("max", v));
    TEST_ASSERT_EQUAL_INT32(INT32_MAX, v);
}

void test_get_text_renders_strings_and_numbers()
{
    DeviceStatus st;
    TEST_ASSERT_TRUE(st.assign("{\"func\":\"PH\",\"rh\":42}"));

    char out[8];
    TEST_ASSERT_TRUE(st.getText("func", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("PH", out);
    TEST_ASSERT_TRUE(st.getText("rh", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("42", out);

    char tiny[2];
    TEST_ASSERT_FALSE(st.getText("func", tiny, sizeof(tiny)));
    TEST_ASSERT_FALSE(st.getText("missing", out, sizeof(out)));
}

void test_has_and_empty_status()
{
    DeviceStatus st;
    TEST_ASSERT_FALSE(st.has("pwr"));
    int32_t v = 0;
    TEST_ASSERT_FALSE(st.getInt("pwr", v));

    TEST_ASSERT_TRUE(st.assign("{\"pwr\":\"0\"}"));
    TEST_ASSERT_TRUE(st.has("pwr"));
    TEST_ASSERT_FALSE(st.has("func"));

    st.clear();
    TEST_ASSERT_TRUE(st.empty());
    TEST_ASSERT_FALSE(st.has("pwr"));
}

void test_patched_overwrites_keys_and_leaves_base_untouched()
{
    DeviceStatus base;
    TEST_ASSERT_TRUE(base.assign("{\"pwr\":\"0\",\"rh\":42}"));

    StaticJsonDocument<128> patch;
    patch["pwr"] = "1";
    patch["rhset"] = 60;

    DeviceStatus out;
    TEST_ASSERT_TRUE(DeviceStatus::patched(base, patch.as<JsonObjectConst>(), out));
    TEST_ASSERT_EQUAL_STRING("{\"pwr\":\"0\",\"rh\":42}", base.json());

    char text[8];
    int32_t v = 0;
    TEST_ASSERT_TRUE(out.getText("pwr", text, sizeof(text)));
    TEST_ASSERT_EQUAL_STRING("1", text);
    TEST_ASSERT_TRUE(out.getInt("rh", v));
    TEST_ASSERT_EQUAL_INT32(42, v);
    TEST_ASSERT_TRUE(out.getInt("rhset", v));
    TEST_ASSERT_EQUAL_INT32(60, v);
}

void test_patched_on_empty_base_starts_from_empty_object()
{
    DeviceStatus base;
    StaticJsonDocument<64> patch;
    patch["func"] = "P";

    DeviceStatus out;
    TEST_ASSERT_TRUE(DeviceStatus::patched(base, patch.as<JsonObjectConst>(), out));
    TEST_ASSERT_EQUAL_STRING("{\"func\":\"P\"}", out.json());
    TEST_ASSERT_TRUE(base.empty());
}

void test_patched_rejects_null_patch()
{
    DeviceStatus base;
    TEST_ASSERT_TRUE(base.assign("{\"pwr\":\"1\"}"));
    DeviceStatus out;
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(DeviceStatus::patched(base, JsonObjectConst(), out, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadStatusJson, (int)err);
    TEST_ASSERT_TRUE(out.empty());
}

void test_equality_compares_canonical_text()
{
    DeviceStatus a;
    DeviceStatus b;
    TEST_ASSERT_TRUE(a == b);

    TEST_ASSERT_TRUE(a.assign("{\"rh\":42}"));
    TEST_ASSERT_TRUE(a != b);
    TEST_ASSERT_TRUE(b.assign("{ \"rh\":  42 }"));
    TEST_ASSERT_TRUE(a == b);
    TEST_ASSERT_TRUE(b.assign("{\"rh\":43}"));
    TEST_ASSERT_FALSE(a == b);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_assign_stores_compact_object);
    RUN_TEST(test_assign_rejects_bad_json_and_keeps_content);
    RUN_TEST(test_assign_rejects_oversized_object);
    RUN_TEST(test_get_int_accepts_numbers_and_numeric_strings);
    RUN_TEST(test_get_int_rejects_values_outside_int32);
    RUN_TEST(test_get_text_renders_strings_and_numbers);
    RUN_TEST(test_has_and_empty_status);
    RUN_TEST(test_patched_overwrites_keys_and_leaves_base_untouched);
    RUN_TEST(test_patched_on_empty_base_starts_from_empty_object);
    RUN_TEST(test_patched_rejects_null_patch);
    RUN_TEST(test_equality_compares_canonical_text);
    return UNITY_END();
}
