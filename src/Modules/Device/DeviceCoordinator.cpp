/**
 * @file DeviceCoordinator.cpp
 * @brief Implementation file.
 */
#include "DeviceCoordinator.h"
#include <string.h>

#define LOG_TAG "DevCoord"
#include "Core/ModuleLog.h"

const char* deviceStateStr(DeviceCoordinator::State s)
{
    switch (s) {
        case DeviceCoordinator::State::Uninitialized: return "uninitialized";
        case DeviceCoordinator::State::Refreshing:    return "refreshing";
        case DeviceCoordinator::State::Observing:     return "observing";
        case DeviceCoordinator::State::Reconnecting:  return "reconnecting";
        case DeviceCoordinator::State::Shutdown:      return "shutdown";
    }
    return "?";
}

bool DeviceCoordinator::Subscription::remove()
{
    if (!owner_) return false;
    DeviceCoordinator* owner = owner_;
    owner_ = nullptr;
    return owner->removeSubscription(id_);
}

DeviceCoordinator::DeviceCoordinator(IDeviceClientFactory& factory, const char* host)
    : DeviceCoordinator(factory, host, Options())
{
}

DeviceCoordinator::DeviceCoordinator(IDeviceClientFactory& factory, const char* host, const Options& opt)
    : factory_(factory),
      opt_(opt),
      timer_("DevWatchdog",
             Limits::Device::DefaultMaxAgeS * opt.maxAgeUnitMs * opt.missedPackageCount,
             &DeviceCoordinator::onWatchdog_, this,
             false /* autostart */, true /* autoRearm */)
{
    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) LOGE("mutex allocation failed");
    strncpy(host_, host ? host : "", sizeof(host_) - 1);
}

DeviceCoordinator::~DeviceCoordinator()
{
    shutdown();
    timer_.drain();

    // Tasks reference this object until taskExited_(), so the wait is not
    // bounded. A task stuck in open() or a listener is reported periodically.
    uint32_t waitedMs = 0;
    while (liveTasks_.load() > 0) {
        vTaskDelay(pdMS_TO_TICKS(10));
        waitedMs += 10;
        if (waitedMs % Limits::Device::TaskJoinWarnMs == 0) {
            LOGW("still waiting for %u task(s) to exit after %lu ms",
                 (unsigned)liveTasks_.load(), (unsigned long)waitedMs);
        }
    }

    if (mutex_) vSemaphoreDelete(mutex_);
    mutex_ = nullptr;
}

void DeviceCoordinator::lock_() const
{
    if (mutex_) xSemaphoreTake(mutex_, portMAX_DELAY);
}

void DeviceCoordinator::unlock_() const
{
    if (mutex_) xSemaphoreGive(mutex_);
}

void DeviceCoordinator::setLinkHook(LinkHook hook, void* ctx)
{
    lock_();
    hook_ = hook;
    hookCtx_ = ctx;
    unlock_();
}

void DeviceCoordinator::emit_(LinkEvent ev)
{
    lock_();
    LinkHook hook = hook_;
    void* ctx = hookCtx_;
    unlock_();
    if (hook) hook(ctx, ev);
}

// ---------------------------------------------------------------------------
// First refresh
// ---------------------------------------------------------------------------

bool DeviceCoordinator::firstRefresh(ErrorCode* err)
{
    char host[Limits::Device::Host];

    lock_();
    if (shutdown_) {
        unlock_();
        setError(err, ErrorCode::ShuttingDown);
        return false;
    }
    state_ = State::Refreshing;
    std::shared_ptr<IDeviceClient> client = client_;
    strncpy(host, host_, sizeof(host));
    unlock_();

    LOGD("first refresh for host %s", host);

    ErrorCode cause = ErrorCode::None;
    if (!client) {
        client = factory_.open(host, &cause);
        if (client) {
            lock_();
            if (!client_ && !shutdown_) client_ = client;
            else client = client_;
            unlock_();
        }
    }

    DeviceStatus fetched;
    uint32_t maxAgeS = 0;
    if (!client || !client->fetchStatus(fetched, maxAgeS, &cause)) {
        LOGE("first refresh failed for host %s (%s)", host, errorCodeStr(cause));
        // Drop the client so the next attempt reopens against the current host.
        lock_();
        if (state_ == State::Refreshing) state_ = State::Uninitialized;
        if (client && client_ == client) client_.reset();
        unlock_();
        if (client) {
            ErrorCode ignored = ErrorCode::None;
            client->close(&ignored);
        }
        setError(err, ErrorCode::ConnectionNotReady);
        return false;
    }
    if (maxAgeS == 0) maxAgeS = Limits::Device::DefaultMaxAgeS;

    lock_();
    if (shutdown_) {
        unlock_();
        setError(err, ErrorCode::ShuttingDown);
        return false;
    }
    status_ = fetched;
    hasStatus_ = true;
    maxAgeS_ = maxAgeS;
    watchdogEnabled_ = true;
    state_ = State::Observing;
    // Listeners added before the client existed are still waiting for a stream.
    if (listenerCount_ > 0 && !observeCtl_) startObservingLocked_();
    unlock_();

    timer_.setTimeout(maxAgeS * opt_.maxAgeUnitMs * opt_.missedPackageCount);
    timer_.reset();

    LOGI("first refresh ok for host %s (max-age=%lus, watchdog=%lums)", host,
         (unsigned long)maxAgeS, (unsigned long)timer_.timeoutMs());
    return true;
}

// ---------------------------------------------------------------------------
// Listeners
// ---------------------------------------------------------------------------

DeviceCoordinator::Subscription DeviceCoordinator::addListener(Listener cb, void* ctx)
{
    if (!cb) return Subscription();

    lock_();
    if (shutdown_) {
        unlock_();
        return Subscription();
    }
    if (listenerCount_ >= Limits::Device::MaxListeners) {
        unlock_();
        LOGW("listener table full (%u)", (unsigned)Limits::Device::MaxListeners);
        return Subscription();
    }

    const uint32_t id = nextListenerId_++;
    listeners_[listenerCount_++] = ListenerEntry{id, cb, ctx};

    bool started = false;
    if (listenerCount_ == 1 && !observeCtl_) {
        started = startObservingLocked_();
    }
    const bool resetWatchdog = started && watchdogEnabled_;
    unlock_();

    if (resetWatchdog) timer_.reset();
    return Subscription(this, id);
}

void DeviceCoordinator::removeAtLocked_(uint8_t idx)
{
    for (uint8_t i = idx; i + 1 < listenerCount_; ++i) listeners_[i] = listeners_[i + 1];
    --listenerCount_;
    if (listenerCount_ == 0) stopObservingLocked_();
}

bool DeviceCoordinator::removeListener(Listener cb, void* ctx)
{
    lock_();
    for (uint8_t i = 0; i < listenerCount_; ++i) {
        if (listeners_[i].cb == cb && listeners_[i].ctx == ctx) {
            removeAtLocked_(i);
            unlock_();
            return true;
        }
    }
    unlock_();
    LOGD("removeListener: not registered");
    return false;
}

bool DeviceCoordinator::removeSubscription(uint32_t id)
{
    lock_();
    for (uint8_t i = 0; i < listenerCount_; ++i) {
        if (listeners_[i].id == id) {
            removeAtLocked_(i);
            unlock_();
            return true;
        }
    }
    unlock_();
    return false;
}

uint8_t DeviceCoordinator::snapshotListenersLocked_(ListenerEntry* out) const
{
    for (uint8_t i = 0; i < listenerCount_; ++i) out[i] = listeners_[i];
    return listenerCount_;
}

void DeviceCoordinator::notify_(const ListenerEntry* entries, uint8_t n)
{
    uint32_t faults = 0;
    for (uint8_t i = 0; i < n; ++i) {
        if (!entries[i].cb(entries[i].ctx)) {
            ++faults;
            LOGW("listener %lu reported a fault", (unsigned long)entries[i].id);
        }
    }
    if (faults == 0) return;
    lock_();
    counters_.listenerFaults += faults;
    unlock_();
}

// ---------------------------------------------------------------------------
// Tasks
// ---------------------------------------------------------------------------

bool DeviceCoordinator::spawnLocked_(const std::shared_ptr<TaskCtl>& ctl, TaskFunction_t fn,
                                     const char* name, uint16_t stack, UBaseType_t prio)
{
    auto* holder = new std::shared_ptr<TaskCtl>(ctl);
    liveTasks_.fetch_add(1);
    if (xTaskCreatePinnedToCore(fn, name, stack, holder, prio, nullptr, 1) != pdPASS) {
        liveTasks_.fetch_sub(1);
        delete holder;
        LOGE("task create failed (%s)", name);
        return false;
    }
    return true;
}

void DeviceCoordinator::taskExited_()
{
    // Last access to this object from a task.
    liveTasks_.fetch_sub(1);
}

bool DeviceCoordinator::startObservingLocked_()
{
    stopObservingLocked_();
    if (shutdown_) return false;
    if (!client_) {
        LOGD("observe deferred: no client yet");
        return false;
    }

    std::shared_ptr<TaskCtl> ctl = std::make_shared<TaskCtl>();
    ctl->owner = this;
    ctl->client = client_;
    if (!spawnLocked_(ctl, &DeviceCoordinator::observeTaskEntry_, "DevObserve",
                      Limits::Device::Task::ObserveStack, Limits::Device::Task::ObservePriority)) {
        return false;
    }
    observeCtl_ = ctl;
    return true;
}

void DeviceCoordinator::stopObservingLocked_()
{
    if (!observeCtl_) return;
    observeCtl_->cancelled.store(true);
    observeCtl_.reset();
}

void DeviceCoordinator::observeTaskEntry_(void* pv)
{
    auto* holder = static_cast<std::shared_ptr<TaskCtl>*>(pv);
    std::shared_ptr<TaskCtl> ctl = *holder;
    delete holder;

    DeviceCoordinator* self = ctl->owner;
    self->runObserve_(*ctl);
    ctl.reset();
    self->taskExited_();
    vTaskDelete(nullptr);
}

void DeviceCoordinator::runObserve_(TaskCtl& ctl)
{
    ErrorCode err = ErrorCode::None;
    std::unique_ptr<IStatusStream> stream = ctl.client ? ctl.client->observeStatus(&err) : nullptr;
    if (!stream) {
        LOGD("observe: stream not available (%s)", errorCodeStr(err));
    } else {
        DeviceStatus next;
        while (!ctl.cancelled.load()) {
            const StreamResult r = stream->next(next, opt_.streamWaitSliceMs);
            if (ctl.cancelled.load()) break;
            if (r == StreamResult::Timeout) continue;
            if (r == StreamResult::Ended) {
                LOGD("observe: stream ended");
                break;
            }
            if (r == StreamResult::Failed) {
                LOGD("observe: stream failed");
                break;
            }
            applyUpdate_(ctl, next);
        }
        stream.reset();
    }

    // Only the current observation clears the slot; a cancelled one was already replaced.
    lock_();
    if (observeCtl_.get() == &ctl) observeCtl_.reset();
    unlock_();
}

void DeviceCoordinator::applyUpdate_(TaskCtl& ctl, const DeviceStatus& next)
{
    ListenerEntry snapshot[Limits::Device::MaxListeners];

    lock_();
    if (ctl.cancelled.load() || shutdown_ || observeCtl_.get() != &ctl) {
        unlock_();
        return;
    }
    status_ = next;
    hasStatus_ = true;
    ++counters_.updates;
    const bool watchdog = watchdogEnabled_;
    const uint8_t n = snapshotListenersLocked_(snapshot);
    unlock_();

    LOGD("status update (%u bytes)", (unsigned)next.length());
    if (watchdog) timer_.reset();
    notify_(snapshot, n);
}

// ---------------------------------------------------------------------------
// Reconnect
// ---------------------------------------------------------------------------

void DeviceCoordinator::onWatchdog_(void* ctx)
{
    DeviceCoordinator* self = static_cast<DeviceCoordinator*>(ctx);
    LOGW("no status update for %lu ms, reconnecting", (unsigned long)self->timer_.timeoutMs());
    self->emit_(LinkEvent::Lost);
    self->reconnect();
}

bool DeviceCoordinator::reconnect()
{
    lock_();
    if (shutdown_) {
        unlock_();
        return false;
    }
    // A hung open() keeps its task alive; never stack more than one straggler.
    const uint8_t running = reconnectTasks_.load();
    if (running >= Limits::Device::MaxReconnectTasks) {
        unlock_();
        LOGW("reconnect deferred, %u attempt(s) still running", (unsigned)running);
        return false;
    }
    if (reconnectCtl_) {
        LOGD("reconnect: superseding attempt in flight");
        reconnectCtl_->cancelled.store(true);
        reconnectCtl_.reset();
    }

    std::shared_ptr<TaskCtl> ctl = std::make_shared<TaskCtl>();
    ctl->owner = this;
    ctl->client = client_;
    strncpy(ctl->host, host_, sizeof(ctl->host) - 1);
    reconnectTasks_.fetch_add(1);
    if (!spawnLocked_(ctl, &DeviceCoordinator::reconnectTaskEntry_, "DevReconnect",
                      Limits::Device::Task::ReconnectStack, Limits::Device::Task::ReconnectPriority)) {
        reconnectTasks_.fetch_sub(1);
        unlock_();
        return false;
    }
    reconnectCtl_ = ctl;
    state_ = State::Reconnecting;
    ++counters_.reconnectsStarted;
    unlock_();
    return true;
}

void DeviceCoordinator::reconnectTaskEntry_(void* pv)
{
    auto* holder = static_cast<std::shared_ptr<TaskCtl>*>(pv);
    std::shared_ptr<TaskCtl> ctl = *holder;
    delete holder;

    DeviceCoordinator* self = ctl->owner;
    self->runReconnect_(ctl);
    ctl.reset();
    self->reconnectTasks_.fetch_sub(1);
    self->taskExited_();
    vTaskDelete(nullptr);
}

void DeviceCoordinator::runReconnect_(const std::shared_ptr<TaskCtl>& ctl)
{
    LOGD("reconnect: host %s", ctl->host);

    if (ctl->cancelled.load()) {
        LOGD("reconnect: superseded before start");
        return;
    }
    // Only the client this attempt replaces; client_ may already be newer.
    if (ctl->client) {
        ErrorCode closeErr = ErrorCode::None;
        if (!ctl->client->close(&closeErr)) LOGD("reconnect: close old client (%s)", errorCodeStr(closeErr));
        ctl->client.reset();
    }

    ErrorCode err = ErrorCode::None;
    std::shared_ptr<IDeviceClient> fresh = factory_.open(ctl->host, &err);

    lock_();
    const bool current = !ctl->cancelled.load() && !shutdown_ && reconnectCtl_ == ctl;
    if (!current) {
        unlock_();
        if (fresh) {
            ErrorCode ignored = ErrorCode::None;
            fresh->close(&ignored);
        }
        LOGD("reconnect: superseded");
        return;
    }
    reconnectCtl_.reset();

    if (!fresh) {
        unlock_();
        LOGW("reconnect to %s failed (%s), retry at next watchdog expiry", ctl->host, errorCodeStr(err));
        emit_(LinkEvent::ReconnectFailed);
        return;
    }

    client_ = fresh;
    state_ = State::Observing;
    ++counters_.reconnectsCompleted;
    bool restarted = false;
    if (listenerCount_ > 0) restarted = startObservingLocked_();
    const bool watchdog = watchdogEnabled_;
    unlock_();

    if (restarted && watchdog) timer_.reset();
    LOGI("reconnected to %s", ctl->host);
    emit_(LinkEvent::Reconnected);
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------

void DeviceCoordinator::shutdown()
{
    lock_();
    if (shutdown_) {
        unlock_();
        return;
    }
    shutdown_ = true;
    state_ = State::Shutdown;
    if (reconnectCtl_) {
        reconnectCtl_->cancelled.store(true);
        reconnectCtl_.reset();
    }
    unlock_();

    timer_.cancel();

    lock_();
    stopObservingLocked_();
    std::shared_ptr<IDeviceClient> client = client_;
    client_.reset();
    unlock_();

    if (client) {
        ErrorCode err = ErrorCode::None;
        if (!client->close(&err)) LOGD("shutdown: close client (%s)", errorCodeStr(err));
    }
    LOGI("shutdown for host %s", host_);
}

// ---------------------------------------------------------------------------
// Accessors and control writes
// ---------------------------------------------------------------------------

void DeviceCoordinator::setHost(const char* host)
{
    lock_();
    strncpy(host_, host ? host : "", sizeof(host_) - 1);
    host_[sizeof(host_) - 1] = '\0';
    unlock_();
}

void DeviceCoordinator::copyHost(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return;
    lock_();
    strncpy(out, host_, outLen - 1);
    out[outLen - 1] = '\0';
    unlock_();
}

bool DeviceCoordinator::copyStatus(DeviceStatus& out) const
{
    lock_();
    const bool ok = hasStatus_;
    if (ok) out = status_;
    unlock_();
    return ok;
}

bool DeviceCoordinator::hasStatus() const
{
    lock_();
    const bool v = hasStatus_;
    unlock_();
    return v;
}

std::shared_ptr<IDeviceClient> DeviceCoordinator::client() const
{
    lock_();
    std::shared_ptr<IDeviceClient> c = client_;
    unlock_();
    return c;
}

bool DeviceCoordinator::setControlValues(JsonObjectConst values, ErrorCode* err)
{
    std::shared_ptr<IDeviceClient> c = client();
    if (!c) {
        setError(err, ErrorCode::ConnectionNotReady);
        return false;
    }
    if (!c->setControlValues(values, err)) return false;

    ErrorCode patchErr = ErrorCode::None;
    if (!patchStatus(values, &patchErr)) {
        LOGW("control write ok but cache patch failed (%s)", errorCodeStr(patchErr));
    }
    return true;
}

bool DeviceCoordinator::setControlValue(const char* key, JsonVariantConst value, ErrorCode* err)
{
    if (!key || key[0] == '\0') {
        setError(err, ErrorCode::MissingArgs);
        return false;
    }
    StaticJsonDocument<Limits::Device::ControlDocCapacity> doc;
    if (!doc[key].set(value)) {
        setError(err, ErrorCode::ArgsTooLarge);
        return false;
    }
    return setControlValues(doc.as<JsonObjectConst>(), err);
}

bool DeviceCoordinator::patchStatus(JsonObjectConst values, ErrorCode* err)
{
    ListenerEntry snapshot[Limits::Device::MaxListeners];

    lock_();
    if (!hasStatus_) {
        unlock_();
        setError(err, ErrorCode::NotReady);
        return false;
    }
    DeviceStatus merged;
    if (!DeviceStatus::patched(status_, values, merged, err)) {
        unlock_();
        return false;
    }
    status_ = merged;
    const uint8_t n = snapshotListenersLocked_(snapshot);
    unlock_();

    notify_(snapshot, n);
    return true;
}

DeviceCoordinator::State DeviceCoordinator::state() const
{
    lock_();
    const State s = state_;
    unlock_();
    return s;
}

DeviceCoordinator::Counters DeviceCoordinator::counters() const
{
    lock_();
    const Counters c = counters_;
    unlock_();
    return c;
}

uint8_t DeviceCoordinator::listenerCount() const
{
    lock_();
    const uint8_t n = listenerCount_;
    unlock_();
    return n;
}

bool DeviceCoordinator::isObserving() const
{
    lock_();
    const bool v = (bool)observeCtl_;
    unlock_();
    return v;
}

bool DeviceCoordinator::isReconnecting() const
{
    lock_();
    const bool v = (bool)reconnectCtl_;
    unlock_();
    return v;
}

uint32_t DeviceCoordinator::maxAgeS() const
{
    lock_();
    const uint32_t v = maxAgeS_;
    unlock_();
    return v;
}
