#pragma once
/**
 * @file DeviceCoordinator.h
 * @brief Owns one device connection: status cache, listeners, observation and reconnect tasks.
 */
#include <atomic>
#include <memory>
#include <stdint.h>

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

#include "Core/ErrorCodes.h"
#include "Core/LivenessTimer.h"
#include "Core/SystemLimits.h"
#include "Modules/Device/DeviceStatus.h"
#include "Modules/Device/Client/IDeviceClient.h"

/**
 * @brief Connection coordinator for one device.
 *
 * Lifecycle: Uninitialized -> Refreshing -> Observing <-> Reconnecting,
 * Shutdown from anywhere (terminal).
 *
 * - firstRefresh() fetches status once and arms the liveness watchdog with
 *   maxAge x missedPackageCount.
 * - The first listener starts the observation task; removing the last one
 *   cancels it. Each pushed update replaces the cached status, resets the
 *   watchdog and is fanned out to listeners in registration order.
 * - When the watchdog expires, reconnect() closes the current client, opens
 *   a new one against the same host and resumes observation. A newer
 *   reconnect supersedes an older one; a superseded attempt closes what it
 *   opened and never commits.
 *
 * One mutex guards client handle, status, listener table and task controls.
 * Listeners run outside it, in the observation task (pushed updates) or in
 * the caller's task (local patches).
 */
class DeviceCoordinator {
public:
    enum class State : uint8_t { Uninitialized, Refreshing, Observing, Reconnecting, Shutdown };

    /** @brief Connection events reported to the owner. */
    enum class LinkEvent : uint8_t { Lost, Reconnected, ReconnectFailed };

    /** @brief Listener callback; return false to report a fault (delivery continues). */
    using Listener = bool (*)(void* ctx);
    using LinkHook = void (*)(void* ctx, LinkEvent ev);

    struct Options {
        uint32_t missedPackageCount = Limits::Device::MissedPackageCount;
        /** @brief Length of one max-age unit in ms (1000 on devices, shorter in tests). */
        uint32_t maxAgeUnitMs = 1000;
        uint32_t streamWaitSliceMs = Limits::Device::StreamWaitSliceMs;
    };

    struct Counters {
        uint32_t updates = 0;
        uint32_t reconnectsStarted = 0;
        uint32_t reconnectsCompleted = 0;
        uint32_t listenerFaults = 0;
    };

    /**
     * @brief Handle returned by addListener(); remove() unsubscribes.
     *
     * Must not outlive the coordinator that issued it.
     */
    class Subscription {
    public:
        Subscription() = default;
        /** @brief Unsubscribe. Safe to call more than once. */
        bool remove();
        bool active() const { return owner_ != nullptr; }
        uint32_t id() const { return id_; }

    private:
        friend class DeviceCoordinator;
        Subscription(DeviceCoordinator* owner, uint32_t id) : owner_(owner), id_(id) {}
        DeviceCoordinator* owner_ = nullptr;
        uint32_t id_ = 0;
    };

    DeviceCoordinator(IDeviceClientFactory& factory, const char* host);
    DeviceCoordinator(IDeviceClientFactory& factory, const char* host, const Options& opt);
    ~DeviceCoordinator();

    DeviceCoordinator(const DeviceCoordinator&) = delete;
    DeviceCoordinator& operator=(const DeviceCoordinator&) = delete;

    /** @brief Report link loss / recovery to the owner. Set before use. */
    void setLinkHook(LinkHook hook, void* ctx);

    /**
     * @brief Open the client if needed and fetch status once.
     * @return false with ConnectionNotReady on failure; status stays absent.
     */
    bool firstRefresh(ErrorCode* err = nullptr);

    /** @brief Register a listener; the first one starts observation. */
    Subscription addListener(Listener cb, void* ctx);
    /** @brief Remove the first matching listener. Unknown listeners are ignored. */
    bool removeListener(Listener cb, void* ctx);
    /** @brief Remove a listener by subscription id. */
    bool removeSubscription(uint32_t id);

    /**
     * @brief Start a reconnect attempt, superseding any attempt in flight.
     * @return false after shutdown, or while MaxReconnectTasks attempts are still running.
     */
    bool reconnect();
    /** @brief Cancel tasks and timer, close the client. Further calls are no-ops. */
    void shutdown();

    /** @brief Host used by future reconnects. */
    void setHost(const char* host);
    void copyHost(char* out, size_t outLen) const;

    /** @brief Copy the cached status; false while absent. */
    bool copyStatus(DeviceStatus& out) const;
    bool hasStatus() const;
    /** @brief Current client handle (may be nullptr). */
    std::shared_ptr<IDeviceClient> client() const;

    /** @brief Write control values through the client, then patch the cache and notify listeners. */
    bool setControlValues(JsonObjectConst values, ErrorCode* err = nullptr);
    bool setControlValue(const char* key, JsonVariantConst value, ErrorCode* err = nullptr);
    /** @brief Merge values into the cached status and notify listeners (no device round-trip). */
    bool patchStatus(JsonObjectConst values, ErrorCode* err = nullptr);

    State state() const;
    Counters counters() const;
    uint8_t listenerCount() const;
    bool isObserving() const;
    bool isReconnecting() const;
    /** @brief Coordinator-owned tasks that have not exited yet (observation and reconnect). */
    uint8_t liveTaskCount() const { return liveTasks_.load(); }
    uint8_t reconnectTaskCount() const { return reconnectTasks_.load(); }
    uint32_t maxAgeS() const;
    uint32_t watchdogTimeoutMs() const { return timer_.timeoutMs(); }
    bool watchdogActive() const { return timer_.isActive(); }

private:
    struct ListenerEntry {
        uint32_t id;
        Listener cb;
        void* ctx;
    };

    /** @brief Shared between the coordinator and one spawned task. */
    struct TaskCtl {
        DeviceCoordinator* owner = nullptr;
        std::atomic<bool> cancelled{false};
        /** @brief Captured at spawn: the client observed, or the client a reconnect replaces. */
        std::shared_ptr<IDeviceClient> client;
        char host[Limits::Device::Host] = {0};
    };

    IDeviceClientFactory& factory_;
    const Options opt_;
    SemaphoreHandle_t mutex_ = nullptr;
    LivenessTimer timer_;

    char host_[Limits::Device::Host] = {0};
    std::shared_ptr<IDeviceClient> client_;
    DeviceStatus status_;
    bool hasStatus_ = false;
    uint32_t maxAgeS_ = Limits::Device::DefaultMaxAgeS;
    bool watchdogEnabled_ = false;
    bool shutdown_ = false;
    State state_ = State::Uninitialized;
    Counters counters_;

    ListenerEntry listeners_[Limits::Device::MaxListeners];
    uint8_t listenerCount_ = 0;
    uint32_t nextListenerId_ = 1;

    std::shared_ptr<TaskCtl> observeCtl_;
    std::shared_ptr<TaskCtl> reconnectCtl_;
    std::atomic<uint8_t> liveTasks_{0};
    std::atomic<uint8_t> reconnectTasks_{0};

    LinkHook hook_ = nullptr;
    void* hookCtx_ = nullptr;

    void lock_() const;
    void unlock_() const;

    bool startObservingLocked_();
    void stopObservingLocked_();
    bool spawnLocked_(const std::shared_ptr<TaskCtl>& ctl, TaskFunction_t fn, const char* name,
                      uint16_t stack, UBaseType_t prio);
    uint8_t snapshotListenersLocked_(ListenerEntry* out) const;
    void notify_(const ListenerEntry* entries, uint8_t n);
    void removeAtLocked_(uint8_t idx);
    void emit_(LinkEvent ev);

    void runObserve_(TaskCtl& ctl);
    void applyUpdate_(TaskCtl& ctl, const DeviceStatus& next);
    void runReconnect_(const std::shared_ptr<TaskCtl>& ctl);
    void taskExited_();

    static void observeTaskEntry_(void* pv);
    static void reconnectTaskEntry_(void* pv);
    static void onWatchdog_(void* ctx);
};

/** @brief Printable state name. */
const char* deviceStateStr(DeviceCoordinator::State s);
