#include <Arduino.h>
#include <unity.h>
#include <atomic>

#include "Modules/Device/DeviceCoordinator.h"
#include "Modules/Device/Client/SimulatedDeviceClient.h"

static const char* kHost = "192.168.1.50";

struct Recorder {
    DeviceCoordinator* coord = nullptr;
    char tag = '?';
    bool fail = false;
    std::atomic<uint32_t> calls{0};
    std::atomic<int32_t> lastV{-1};
};

static std::atomic<uint8_t> gOrderLen{0};
static char gOrder[32];

static bool recordingListener(void* ctx)
{
    Recorder* p = static_cast<Recorder*>(ctx);
    p->calls.fetch_add(1);

    const uint8_t i = gOrderLen.fetch_add(1);
    if (i < sizeof(gOrder)) gOrder[i] = p->tag;

    DeviceStatus s;
    int32_t v = -1;
    if (p->coord && p->coord->copyStatus(s) && s.getInt("v", v)) p->lastV.store(v);
    return !p->fail;
}

static void clearOrder()
{
    gOrderLen.store(0);
    memset(gOrder, 0, sizeof(gOrder));
}

template <typename Pred>
static bool waitFor(Pred pred, uint32_t timeoutMs)
{
    const uint32_t t0 = millis();
    while (!pred()) {
        if (millis() - t0 >= timeoutMs) return false;
        delay(5);
    }
    return true;
}

/** 10 ms max-age unit: maxAge=10 gives a 300 ms watchdog. */
static DeviceCoordinator::Options fastOptions()
{
    DeviceCoordinator::Options o;
    o.missedPackageCount = 3;
    o.maxAgeUnitMs = 10;
    o.streamWaitSliceMs = 50;
    return o;
}

/** 100 ms max-age unit: the watchdog stays out of the way. */
static DeviceCoordinator::Options slowOptions()
{
    DeviceCoordinator::Options o = fastOptions();
    o.maxAgeUnitMs = 100;
    return o;
}

static void primeDevice(SimulatedDevice& dev, uint32_t maxAgeS = 10)
{
    dev.setHost(kHost);
    dev.setStatus("{\"v\":1,\"a\":1,\"b\":2}");
    dev.setMaxAgeS(maxAgeS);
}

void test_first_refresh_failure_reports_connection_not_ready()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());

    dev.failNextOpens(1);
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(c.firstRefresh(&err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ConnectionNotReady, (int)err);
    TEST_ASSERT_FALSE(c.hasStatus());
    TEST_ASSERT_FALSE(c.isObserving());
    TEST_ASSERT_FALSE(c.watchdogActive());
    TEST_ASSERT_EQUAL_INT((int)DeviceCoordinator::State::Uninitialized, (int)c.state());

    // Open ok, fetch fails: the half-open client is closed, not kept.
    dev.failNextFetches(1);
    err = ErrorCode::None;
    TEST_ASSERT_FALSE(c.firstRefresh(&err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ConnectionNotReady, (int)err);
    TEST_ASSERT_EQUAL_UINT32(1, dev.opens());
    TEST_ASSERT_EQUAL_UINT32(1, dev.closes());
    TEST_ASSERT_TRUE(c.client() == nullptr);

    TEST_ASSERT_TRUE(c.firstRefresh(&err));
    TEST_ASSERT_TRUE(c.hasStatus());
}

void test_first_refresh_sizes_watchdog_from_max_age()
{
    SimulatedDevice dev;
    primeDevice(dev, 60);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator::Options o = fastOptions();
    o.maxAgeUnitMs = 1;
    DeviceCoordinator c(factory, kHost, o);

    TEST_ASSERT_FALSE(c.watchdogActive());
    TEST_ASSERT_TRUE(c.firstRefresh());
    TEST_ASSERT_EQUAL_UINT32(60, c.maxAgeS());
    TEST_ASSERT_EQUAL_UINT32(180, c.watchdogTimeoutMs());
    TEST_ASSERT_TRUE(c.watchdogActive());
    TEST_ASSERT_EQUAL_INT((int)DeviceCoordinator::State::Observing, (int)c.state());
    TEST_ASSERT_FALSE(c.isObserving());
}

void test_observation_runs_only_while_listeners_exist()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder a, b;
    TEST_ASSERT_FALSE(c.isObserving());
    DeviceCoordinator::Subscription sa = c.addListener(recordingListener, &a);
    TEST_ASSERT_TRUE(sa.active());
    TEST_ASSERT_TRUE(c.isObserving());
    DeviceCoordinator::Subscription sb = c.addListener(recordingListener, &b);
    TEST_ASSERT_EQUAL_UINT8(2, c.listenerCount());

    TEST_ASSERT_TRUE(sa.remove());
    TEST_ASSERT_TRUE(c.isObserving());
    TEST_ASSERT_TRUE(sb.remove());
    TEST_ASSERT_FALSE(c.isObserving());
    TEST_ASSERT_EQUAL_UINT8(0, c.listenerCount());

    // Stopping observation leaves timer and client alone.
    TEST_ASSERT_TRUE(c.watchdogActive());
    TEST_ASSERT_TRUE(c.client() != nullptr);

    TEST_ASSERT_TRUE(c.addListener(recordingListener, &a).active());
    TEST_ASSERT_TRUE(c.isObserving());
}

void test_listeners_run_in_order_after_cache_update()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder a, b, d;
    a.coord = b.coord = d.coord = &c;
    a.tag = 'A'; b.tag = 'B'; d.tag = 'C';
    c.addListener(recordingListener, &a);
    c.addListener(recordingListener, &b);
    c.addListener(recordingListener, &d);

    // Stream delivers the current status first (possibly before B and C joined).
    TEST_ASSERT_TRUE(waitFor([&] { return a.calls.load() >= 1; }, 500));
    delay(50);
    clearOrder();
    a.calls = 0; b.calls = 0; d.calls = 0;

    dev.setStatus("{\"v\":2}");
    TEST_ASSERT_TRUE(waitFor([&] { return d.calls.load() >= 1; }, 500));
    delay(50);

    TEST_ASSERT_EQUAL_UINT32(1, a.calls.load());
    TEST_ASSERT_EQUAL_UINT32(1, b.calls.load());
    TEST_ASSERT_EQUAL_UINT32(1, d.calls.load());
    TEST_ASSERT_EQUAL_STRING("ABC", gOrder);
    TEST_ASSERT_EQUAL_INT32(2, a.lastV.load());
    TEST_ASSERT_EQUAL_INT32(2, b.lastV.load());
    TEST_ASSERT_EQUAL_INT32(2, d.lastV.load());
    TEST_ASSERT_TRUE(c.counters().updates >= 2);
}

void test_status_is_replaced_wholesale()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder p;
    p.coord = &c;
    c.addListener(recordingListener, &p);
    TEST_ASSERT_TRUE(waitFor([&] { return p.calls.load() >= 1; }, 500));

    dev.setStatus("{\"v\":3,\"a\":9}");
    TEST_ASSERT_TRUE(waitFor([&] { return p.lastV.load() == 3; }, 500));

    DeviceStatus s;
    TEST_ASSERT_TRUE(c.copyStatus(s));
    int32_t a = 0;
    TEST_ASSERT_TRUE(s.getInt("a", a));
    TEST_ASSERT_EQUAL_INT32(9, a);
    TEST_ASSERT_FALSE(s.has("b"));
}

void test_removing_unknown_listener_is_harmless()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder a, stranger;
    DeviceCoordinator::Subscription sa = c.addListener(recordingListener, &a);
    TEST_ASSERT_FALSE(c.removeListener(recordingListener, &stranger));
    TEST_ASSERT_EQUAL_UINT8(1, c.listenerCount());
    TEST_ASSERT_TRUE(c.isObserving());

    TEST_ASSERT_TRUE(sa.remove());
    TEST_ASSERT_FALSE(sa.remove());
    TEST_ASSERT_FALSE(c.removeSubscription(sa.id()));
    TEST_ASSERT_EQUAL_UINT8(0, c.listenerCount());
}

void test_duplicate_listeners_are_distinct_subscriptions()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder p;
    DeviceCoordinator::Subscription s1 = c.addListener(recordingListener, &p);
    DeviceCoordinator::Subscription s2 = c.addListener(recordingListener, &p);
    TEST_ASSERT_NOT_EQUAL(s1.id(), s2.id());
    TEST_ASSERT_EQUAL_UINT8(2, c.listenerCount());

    TEST_ASSERT_TRUE(s2.remove());
    TEST_ASSERT_EQUAL_UINT8(1, c.listenerCount());
    TEST_ASSERT_TRUE(c.isObserving());
}

void test_listener_fault_does_not_stop_delivery()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder bad, good;
    bad.fail = true;
    c.addListener(recordingListener, &bad);
    c.addListener(recordingListener, &good);

    TEST_ASSERT_TRUE(waitFor([&] { return bad.calls.load() >= 1; }, 500));
    delay(50);
    bad.calls = 0;
    good.calls = 0;

    dev.setStatus("{\"v\":5}");
    TEST_ASSERT_TRUE(waitFor([&] { return good.calls.load() >= 1; }, 500));
    TEST_ASSERT_EQUAL_UINT32(1, bad.calls.load());
    TEST_ASSERT_EQUAL_UINT32(1, good.calls.load());
    TEST_ASSERT_TRUE(c.counters().listenerFaults >= 1);
}

void test_subscribe_storm_starts_one_observation()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    static Recorder recorders[Limits::Device::MaxListeners];
    for (uint8_t i = 0; i < Limits::Device::MaxListeners; ++i) {
        recorders[i].calls = 0;
        TEST_ASSERT_TRUE(c.addListener(recordingListener, &recorders[i]).active());
    }
    TEST_ASSERT_TRUE(c.isObserving());

    Recorder extra;
    TEST_ASSERT_FALSE(c.addListener(recordingListener, &extra).active());

    TEST_ASSERT_TRUE(waitFor([&] { return recorders[0].calls.load() >= 1; }, 500));
    delay(50);
    for (uint8_t i = 0; i < Limits::Device::MaxListeners; ++i) recorders[i].calls = 0;

    dev.setStatus("{\"v\":7}");
    TEST_ASSERT_TRUE(waitFor([&] { return recorders[Limits::Device::MaxListeners - 1].calls.load() >= 1; }, 500));
    delay(100);
    for (uint8_t i = 0; i < Limits::Device::MaxListeners; ++i) {
        TEST_ASSERT_EQUAL_UINT32(1, recorders[i].calls.load());
    }

    for (uint8_t i = 0; i < Limits::Device::MaxListeners; ++i) c.removeListener(recordingListener, &recorders[i]);
}

void test_missing_updates_trigger_one_reconnect()
{
    SimulatedDevice dev;
    primeDevice(dev);
    dev.setPushPeriodMs(100);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());
    TEST_ASSERT_EQUAL_UINT32(300, c.watchdogTimeoutMs());

    Recorder p;
    c.addListener(recordingListener, &p);

    // Periodic pushes keep the watchdog quiet.
    delay(600);
    TEST_ASSERT_EQUAL_UINT32(0, c.counters().reconnectsStarted);
    TEST_ASSERT_TRUE(p.calls.load() >= 4);

    dev.setStalled(true);
    delay(420);
    DeviceCoordinator::Counters n = c.counters();
    TEST_ASSERT_EQUAL_UINT32(1, n.reconnectsStarted);
    TEST_ASSERT_EQUAL_UINT32(1, n.reconnectsCompleted);
    TEST_ASSERT_EQUAL_UINT32(2, dev.opens());
    TEST_ASSERT_EQUAL_UINT32(1, dev.closes());
    TEST_ASSERT_EQUAL_INT((int)DeviceCoordinator::State::Observing, (int)c.state());
    TEST_ASSERT_TRUE(c.isObserving());

    // Device answers again: the new stream resets the watchdog.
    dev.setStalled(false);
    const uint32_t callsBefore = p.calls.load();
    delay(500);
    TEST_ASSERT_TRUE(p.calls.load() > callsBefore);
    TEST_ASSERT_EQUAL_UINT32(1, c.counters().reconnectsStarted);
    TEST_ASSERT_TRUE(c.watchdogActive());
}

void test_stream_end_is_recovered_by_watchdog()
{
    SimulatedDevice dev;
    primeDevice(dev);
    dev.setPushPeriodMs(100);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder p;
    c.addListener(recordingListener, &p);
    TEST_ASSERT_TRUE(waitFor([&] { return p.calls.load() >= 1; }, 500));

    dev.endStreams();
    TEST_ASSERT_TRUE(waitFor([&] { return !c.isObserving(); }, 200));
    TEST_ASSERT_EQUAL_UINT8(1, c.listenerCount());
    TEST_ASSERT_EQUAL_UINT32(0, c.counters().reconnectsCompleted);

    TEST_ASSERT_TRUE(waitFor([&] { return c.counters().reconnectsCompleted == 1; }, 600));
    TEST_ASSERT_TRUE(waitFor([&] { return c.isObserving(); }, 200));
    const uint32_t callsBefore = p.calls.load();
    TEST_ASSERT_TRUE(waitFor([&] { return p.calls.load() > callsBefore; }, 500));
}

void test_newer_reconnect_supersedes_attempt_in_flight()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, slowOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    dev.setOpenDelayMs(200);
    TEST_ASSERT_TRUE(c.reconnect());
    delay(50);
    TEST_ASSERT_TRUE(c.isReconnecting());
    TEST_ASSERT_TRUE(c.reconnect());
    TEST_ASSERT_TRUE(c.isReconnecting());

    TEST_ASSERT_TRUE(waitFor([&] { return !c.isReconnecting(); }, 1000));
    delay(250);

    DeviceCoordinator::Counters n = c.counters();
    TEST_ASSERT_EQUAL_UINT32(2, n.reconnectsStarted);
    TEST_ASSERT_EQUAL_UINT32(1, n.reconnectsCompleted);
    // Initial client closed once, superseded client closed by its own task.
    TEST_ASSERT_EQUAL_UINT32(3, dev.opens());
    TEST_ASSERT_EQUAL_UINT32(2, dev.closes());

    std::shared_ptr<IDeviceClient> current = c.client();
    TEST_ASSERT_TRUE(current != nullptr);
    DeviceStatus s;
    uint32_t maxAge = 0;
    TEST_ASSERT_TRUE(current->fetchStatus(s, maxAge, nullptr));
}

struct ReconnectBurst {
    DeviceCoordinator* coord = nullptr;
    std::atomic<uint8_t> accepted{0};
    std::atomic<bool> done{false};
};

static void reconnectBurstTask(void* pv)
{
    ReconnectBurst* b = static_cast<ReconnectBurst*>(pv);
    if (b->coord->reconnect()) b->accepted.fetch_add(1);
    if (b->coord->reconnect()) b->accepted.fetch_add(1);
    b->done.store(true);
    vTaskDelete(nullptr);
}

void test_back_to_back_reconnects_keep_committed_client()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, slowOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    // Higher priority on the reconnect core: neither attempt starts before both are issued.
    ReconnectBurst burst;
    burst.coord = &c;
    TEST_ASSERT_EQUAL_INT(pdPASS, xTaskCreatePinnedToCore(reconnectBurstTask, "ReconBurst", 4096, &burst,
                                                          Limits::Device::Task::ReconnectPriority + 1,
                                                          nullptr, 1));
    TEST_ASSERT_TRUE(waitFor([&] { return burst.done.load(); }, 500));
    TEST_ASSERT_EQUAL_UINT8(2, burst.accepted.load());

    TEST_ASSERT_TRUE(waitFor([&] { return !c.isReconnecting(); }, 1000));
    TEST_ASSERT_TRUE(waitFor([&] { return c.reconnectTaskCount() == 0; }, 1000));

    DeviceCoordinator::Counters n = c.counters();
    TEST_ASSERT_EQUAL_UINT32(2, n.reconnectsStarted);
    TEST_ASSERT_EQUAL_UINT32(1, n.reconnectsCompleted);
    // The cancelled attempt neither opened nor closed anything.
    TEST_ASSERT_EQUAL_UINT32(2, dev.opens());
    TEST_ASSERT_EQUAL_UINT32(1, dev.closes());

    std::shared_ptr<IDeviceClient> current = c.client();
    TEST_ASSERT_TRUE(current != nullptr);
    DeviceStatus s;
    uint32_t maxAge = 0;
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_TRUE(current->fetchStatus(s, maxAge, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)err);
}

void test_hung_open_bounds_reconnect_tasks()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder p;
    c.addListener(recordingListener, &p);
    TEST_ASSERT_TRUE(waitFor([&] { return p.calls.load() >= 1; }, 500));

    // Opens hang for 2 s while the 300 ms watchdog keeps expiring.
    dev.setOpenDelayMs(2000);
    dev.setStalled(true);

    uint8_t maxReconnect = 0;
    uint8_t maxLive = 0;
    const uint32_t t0 = millis();
    while (millis() - t0 < 1800) {
        if (c.reconnectTaskCount() > maxReconnect) maxReconnect = c.reconnectTaskCount();
        if (c.liveTaskCount() > maxLive) maxLive = c.liveTaskCount();
        delay(10);
    }
    TEST_ASSERT_TRUE(maxReconnect >= 1);
    TEST_ASSERT_TRUE(maxReconnect <= Limits::Device::MaxReconnectTasks);
    TEST_ASSERT_TRUE(maxLive <= Limits::Device::MaxReconnectTasks + 1);
    TEST_ASSERT_EQUAL_UINT32(Limits::Device::MaxReconnectTasks, c.counters().reconnectsStarted);
    TEST_ASSERT_FALSE(c.reconnect());

    dev.setOpenDelayMs(0);
    dev.setStalled(false);
    TEST_ASSERT_TRUE(waitFor([&] { return c.counters().reconnectsCompleted >= 1; }, 4000));
    TEST_ASSERT_TRUE(waitFor([&] { return c.reconnectTaskCount() == 0; }, 3000));
    TEST_ASSERT_TRUE(c.isObserving());
}

void test_failed_reconnect_is_swallowed()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, slowOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    dev.failNextOpens(1);
    TEST_ASSERT_TRUE(c.reconnect());
    TEST_ASSERT_TRUE(waitFor([&] { return !c.isReconnecting(); }, 500));
    TEST_ASSERT_EQUAL_UINT32(0, c.counters().reconnectsCompleted);
    TEST_ASSERT_TRUE(c.watchdogActive());
}

void test_control_write_patches_cache_and_notifies()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder p;
    p.coord = &c;
    c.addListener(recordingListener, &p);
    TEST_ASSERT_TRUE(waitFor([&] { return p.calls.load() >= 1; }, 500));
    const uint32_t before = p.calls.load();

    StaticJsonDocument<64> doc;
    doc["v"] = 42;
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_TRUE(c.setControlValue("v", doc["v"], &err));
    TEST_ASSERT_EQUAL_UINT32(1, dev.writes());
    TEST_ASSERT_TRUE(p.calls.load() > before);
    TEST_ASSERT_EQUAL_INT32(42, p.lastV.load());

    dev.setFailWrites(true);
    TEST_ASSERT_FALSE(c.setControlValue("v", doc["v"], &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::IoError, (int)err);
}

void test_shutdown_is_terminal_and_idempotent()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    TEST_ASSERT_TRUE(c.firstRefresh());

    Recorder p;
    c.addListener(recordingListener, &p);
    TEST_ASSERT_TRUE(c.isObserving());

    c.shutdown();
    TEST_ASSERT_EQUAL_INT((int)DeviceCoordinator::State::Shutdown, (int)c.state());
    TEST_ASSERT_FALSE(c.isObserving());
    TEST_ASSERT_FALSE(c.watchdogActive());
    TEST_ASSERT_TRUE(c.client() == nullptr);
    TEST_ASSERT_EQUAL_UINT32(1, dev.closes());

    c.shutdown();
    TEST_ASSERT_EQUAL_UINT32(1, dev.closes());
    TEST_ASSERT_FALSE(c.reconnect());
    TEST_ASSERT_FALSE(c.addListener(recordingListener, &p).active());
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(c.firstRefresh(&err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ShuttingDown, (int)err);
}

void test_shutdown_before_first_refresh()
{
    SimulatedDevice dev;
    primeDevice(dev);
    SimulatedDeviceClientFactory factory(dev);
    DeviceCoordinator c(factory, kHost, fastOptions());
    c.shutdown();
    TEST_ASSERT_EQUAL_INT((int)DeviceCoordinator::State::Shutdown, (int)c.state());
    TEST_ASSERT_EQUAL_UINT32(0, dev.closes());
}

void setup()
{
    delay(2000);
    UNITY_BEGIN();
    RUN_TEST(test_first_refresh_failure_reports_connection_not_ready);
    RUN_TEST(test_first_refresh_sizes_watchdog_from_max_age);
    RUN_TEST(test_observation_runs_only_while_listeners_exist);
    RUN_TEST(test_listeners_run_in_order_after_cache_update);
    RUN_TEST(test_status_is_replaced_wholesale);
    RUN_TEST(test_removing_unknown_listener_is_harmless);
    RUN_TEST(test_duplicate_listeners_are_distinct_subscriptions);
    RUN_TEST(test_listener_fault_does_not_stop_delivery);
    RUN_TEST(test_subscribe_storm_starts_one_observation);
    RUN_TEST(test_missing_updates_trigger_one_reconnect);
    RUN_TEST(test_stream_end_is_recovered_by_watchdog);
    RUN_TEST(test_newer_reconnect_supersedes_attempt_in_flight);
    RUN_TEST(test_back_to_back_reconnects_keep_committed_client);
    RUN_TEST(test_hung_open_bounds_reconnect_tasks);
    RUN_TEST(test_failed_reconnect_is_swallowed);
    RUN_TEST(test_control_write_patches_cache_and_notifies);
    RUN_TEST(test_shutdown_is_terminal_and_idempotent);
    RUN_TEST(test_shutdown_before_first_refresh);
    UNITY_END();
}

void loop() {}
