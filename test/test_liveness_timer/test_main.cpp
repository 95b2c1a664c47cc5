#include <Arduino.h>
#include <unity.h>

#include "Core/LivenessTimer.h"

struct FireCounter {
    volatile uint32_t calls = 0;
    volatile uint32_t lastMs = 0;
};

static void countFire(void* ctx)
{
    FireCounter* c = static_cast<FireCounter*>(ctx);
    c->calls = c->calls + 1;
    c->lastMs = millis();
}

struct SelfReset {
    LivenessTimer* timer = nullptr;
    volatile uint32_t calls = 0;
};

static void resetFromCallback(void* ctx)
{
    SelfReset* s = static_cast<SelfReset*>(ctx);
    s->calls = s->calls + 1;
    if (s->calls == 1 && s->timer) s->timer->reset();
}

void test_fires_once_after_timeout()
{
    FireCounter c;
    LivenessTimer t("t_once", 100, countFire, &c);
    TEST_ASSERT_TRUE(t.start());
    TEST_ASSERT_TRUE(t.isActive());

    delay(60);
    TEST_ASSERT_EQUAL_UINT32(0, c.calls);

    delay(120);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
    TEST_ASSERT_FALSE(t.isActive());

    delay(200);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
    TEST_ASSERT_EQUAL_UINT32(1, t.fireCount());
}

void test_reset_before_deadline_suppresses_fire()
{
    FireCounter c;
    LivenessTimer t("t_reset", 150, countFire, &c);
    const uint32_t t0 = millis();
    TEST_ASSERT_TRUE(t.start());

    delay(100);
    TEST_ASSERT_TRUE(t.reset());
    delay(100);
    // First deadline (150 ms) has passed without a callback.
    TEST_ASSERT_EQUAL_UINT32(0, c.calls);

    delay(100);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
    TEST_ASSERT_UINT32_WITHIN(40, 250, c.lastMs - t0);
}

void test_repeated_resets_never_fire()
{
    FireCounter c;
    LivenessTimer t("t_keep", 100, countFire, &c);
    TEST_ASSERT_TRUE(t.start());
    for (int i = 0; i < 10; ++i) {
        delay(40);
        TEST_ASSERT_TRUE(t.reset());
    }
    TEST_ASSERT_EQUAL_UINT32(0, c.calls);
    t.cancel();
}

void test_missed_resets_do_not_accumulate()
{
    FireCounter c;
    LivenessTimer t("t_edge", 50, countFire, &c);
    TEST_ASSERT_TRUE(t.start());
    delay(400);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
}

void test_auto_rearm_fires_once_per_period()
{
    FireCounter c;
    LivenessTimer t("t_rearm", 100, countFire, &c, false, true);
    TEST_ASSERT_TRUE(t.autoRearm());
    TEST_ASSERT_TRUE(t.start());

    delay(550);
    TEST_ASSERT_UINT32_WITHIN(1, 5, c.calls);
    TEST_ASSERT_TRUE(t.isActive());

    TEST_ASSERT_TRUE(t.cancel());
    const uint32_t after = c.calls;
    delay(250);
    TEST_ASSERT_EQUAL_UINT32(after, c.calls);
}

void test_autostart_counts_immediately()
{
    FireCounter c;
    LivenessTimer t("t_auto", 80, countFire, &c, true);
    TEST_ASSERT_TRUE(t.isActive());
    delay(150);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
}

void test_cancel_is_inert_until_start()
{
    FireCounter c;
    LivenessTimer t("t_cancel", 80, countFire, &c);
    TEST_ASSERT_TRUE(t.start());
    delay(30);
    TEST_ASSERT_TRUE(t.cancel());
    TEST_ASSERT_FALSE(t.isActive());

    delay(200);
    TEST_ASSERT_EQUAL_UINT32(0, c.calls);

    TEST_ASSERT_TRUE(t.start());
    delay(150);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
}

void test_set_timeout_applies_to_next_countdown()
{
    FireCounter c;
    LivenessTimer t("t_tmo", 100, countFire, &c);
    const uint32_t t0 = millis();
    TEST_ASSERT_TRUE(t.start());
    t.setTimeout(300);
    TEST_ASSERT_EQUAL_UINT32(300, t.timeoutMs());

    // Running countdown keeps its 100 ms duration.
    delay(160);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
    TEST_ASSERT_UINT32_WITHIN(40, 100, c.lastMs - t0);

    const uint32_t t1 = millis();
    TEST_ASSERT_TRUE(t.start());
    delay(200);
    TEST_ASSERT_EQUAL_UINT32(1, c.calls);
    delay(160);
    TEST_ASSERT_EQUAL_UINT32(2, c.calls);
    TEST_ASSERT_UINT32_WITHIN(40, 300, c.lastMs - t1);
}

void test_reset_from_callback_replaces_rearm()
{
    SelfReset s;
    LivenessTimer t("t_self", 80, resetFromCallback, &s, false, true);
    s.timer = &t;
    TEST_ASSERT_TRUE(t.start());

    // First fire resets (one countdown), the next fires rearm normally.
    delay(130);
    TEST_ASSERT_EQUAL_UINT32(1, s.calls);
    delay(80);
    TEST_ASSERT_EQUAL_UINT32(2, s.calls);
    t.cancel();
}

void setup()
{
    delay(2000);
    UNITY_BEGIN();
    RUN_TEST(test_fires_once_after_timeout);
    RUN_TEST(test_reset_before_deadline_suppresses_fire);
    RUN_TEST(test_repeated_resets_never_fire);
    RUN_TEST(test_missed_resets_do_not_accumulate);
    RUN_TEST(test_auto_rearm_fires_once_per_period);
    RUN_TEST(test_autostart_counts_immediately);
    RUN_TEST(test_cancel_is_inert_until_start);
    RUN_TEST(test_set_timeout_applies_to_next_countdown);
    RUN_TEST(test_reset_from_callback_replaces_rearm);
    UNITY_END();
}

void loop() {}
