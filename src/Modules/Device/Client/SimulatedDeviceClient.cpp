/**
 * @file SimulatedDeviceClient.cpp
 * @brief Implementation file.
 */
#include "SimulatedDeviceClient.h"
#include <string.h>
#include <freertos/task.h>

#define LOG_TAG "SimDev"
#include "Core/ModuleLog.h"

namespace {

constexpr uint32_t kStreamPollMs = 10;

/** @brief Stream bound to one client; ends when the client closes or the device ends streams. */
class SimulatedStatusStream : public IStatusStream {
public:
    SimulatedStatusStream(SimulatedDevice& dev, std::shared_ptr<std::atomic<bool>> closed)
        : dev_(dev), closed_(std::move(closed)), epoch_(dev.streamEpoch()) {}

    StreamResult next(DeviceStatus& out, uint32_t waitMs) override
    {
        const TickType_t start = xTaskGetTickCount();
        const TickType_t wait = pdMS_TO_TICKS(waitMs);
        TickType_t pollTicks = pdMS_TO_TICKS(kStreamPollMs);
        if (pollTicks == 0) pollTicks = 1;

        while (true) {
            if (closed_->load()) return StreamResult::Ended;
            if (dev_.streamEpoch() != epoch_) return StreamResult::Ended;

            const TickType_t now = xTaskGetTickCount();
            if (!dev_.stalled()) {
                const uint32_t periodMs = dev_.pushPeriodMs();
                const bool periodic = primed_ && periodMs > 0 &&
                                      (TickType_t)(now - lastEmit_) >= pdMS_TO_TICKS(periodMs);
                if (!primed_ || periodic || dev_.statusSeq() != lastSeq_) {
                    uint32_t seq = 0;
                    if (!dev_.snapshot(out, seq)) return StreamResult::Failed;
                    lastSeq_ = seq;
                    lastEmit_ = now;
                    primed_ = true;
                    return StreamResult::Update;
                }
            }

            if ((TickType_t)(now - start) >= wait) return StreamResult::Timeout;
            vTaskDelay(pollTicks);
        }
    }

private:
    SimulatedDevice& dev_;
    std::shared_ptr<std::atomic<bool>> closed_;
    uint32_t epoch_;
    uint32_t lastSeq_ = 0;
    TickType_t lastEmit_ = 0;
    bool primed_ = false;
};

}  // namespace

// ---------------------------------------------------------------------------
// SimulatedDevice
// ---------------------------------------------------------------------------

SimulatedDevice::SimulatedDevice()
{
    mutex_ = xSemaphoreCreateMutex();
}

SimulatedDevice::~SimulatedDevice()
{
    if (mutex_) vSemaphoreDelete(mutex_);
    mutex_ = nullptr;
}

void SimulatedDevice::lock_() const
{
    if (mutex_) xSemaphoreTake(mutex_, portMAX_DELAY);
}

void SimulatedDevice::unlock_() const
{
    if (mutex_) xSemaphoreGive(mutex_);
}

void SimulatedDevice::setHost(const char* host)
{
    lock_();
    strncpy(host_, host ? host : "", sizeof(host_) - 1);
    host_[sizeof(host_) - 1] = '\0';
    unlock_();
}

bool SimulatedDevice::setStatus(const char* json)
{
    DeviceStatus next;
    if (!next.assign(json)) return false;
    lock_();
    status_ = next;
    ++seq_;
    unlock_();
    return true;
}

bool SimulatedDevice::applyValues(JsonObjectConst values, ErrorCode* err)
{
    lock_();
    if (failWrites_) {
        unlock_();
        setError(err, ErrorCode::IoError);
        return false;
    }
    DeviceStatus merged;
    const bool ok = DeviceStatus::patched(status_, values, merged, err);
    if (ok) {
        status_ = merged;
        ++seq_;
        ++writes_;
    }
    unlock_();
    return ok;
}

void SimulatedDevice::setMaxAgeS(uint32_t s)
{
    lock_();
    maxAgeS_ = s;
    unlock_();
}

void SimulatedDevice::setPushPeriodMs(uint32_t ms)
{
    lock_();
    pushPeriodMs_ = ms;
    unlock_();
}

void SimulatedDevice::failNextOpens(uint8_t n)
{
    lock_();
    failOpens_ = n;
    unlock_();
}

void SimulatedDevice::failNextFetches(uint8_t n)
{
    lock_();
    failFetches_ = n;
    unlock_();
}

void SimulatedDevice::setOpenDelayMs(uint32_t ms)
{
    lock_();
    openDelayMs_ = ms;
    unlock_();
}

void SimulatedDevice::setStalled(bool stalled)
{
    lock_();
    stalled_ = stalled;
    unlock_();
}

void SimulatedDevice::setFailWrites(bool fail)
{
    lock_();
    failWrites_ = fail;
    unlock_();
}

void SimulatedDevice::endStreams()
{
    lock_();
    ++streamEpoch_;
    unlock_();
}

uint32_t SimulatedDevice::opens() const
{
    lock_();
    const uint32_t v = opens_;
    unlock_();
    return v;
}

uint32_t SimulatedDevice::closes() const
{
    lock_();
    const uint32_t v = closes_;
    unlock_();
    return v;
}

uint32_t SimulatedDevice::writes() const
{
    lock_();
    const uint32_t v = writes_;
    unlock_();
    return v;
}

uint32_t SimulatedDevice::statusSeq() const
{
    lock_();
    const uint32_t v = seq_;
    unlock_();
    return v;
}

bool SimulatedDevice::copyStatus(DeviceStatus& out) const
{
    uint32_t seq = 0;
    return snapshot(out, seq);
}

bool SimulatedDevice::snapshot(DeviceStatus& out, uint32_t& seq) const
{
    lock_();
    const bool ok = !status_.empty();
    if (ok) {
        out = status_;
        seq = seq_;
    }
    unlock_();
    return ok;
}

bool SimulatedDevice::acceptOpen(const char* host, ErrorCode* err)
{
    lock_();
    const uint32_t delayMs = openDelayMs_;
    unlock_();
    if (delayMs > 0) vTaskDelay(pdMS_TO_TICKS(delayMs));

    lock_();
    bool ok = true;
    if (failOpens_ > 0) {
        --failOpens_;
        ok = false;
    } else if (host_[0] != '\0' && (!host || strcmp(host, host_) != 0)) {
        ok = false;
    }
    if (ok) ++opens_;
    unlock_();

    if (!ok) setError(err, ErrorCode::ConnectionNotReady);
    return ok;
}

bool SimulatedDevice::fetch(DeviceStatus& out, uint32_t& maxAgeS, ErrorCode* err)
{
    lock_();
    bool ok = true;
    if (failFetches_ > 0) {
        --failFetches_;
        ok = false;
    } else if (stalled_ || status_.empty()) {
        ok = false;
    }
    if (ok) {
        out = status_;
        maxAgeS = maxAgeS_;
    }
    unlock_();

    if (!ok) setError(err, ErrorCode::Timeout);
    return ok;
}

void SimulatedDevice::noteClose()
{
    lock_();
    ++closes_;
    unlock_();
}

uint32_t SimulatedDevice::streamEpoch() const
{
    lock_();
    const uint32_t v = streamEpoch_;
    unlock_();
    return v;
}

bool SimulatedDevice::stalled() const
{
    lock_();
    const bool v = stalled_;
    unlock_();
    return v;
}

uint32_t SimulatedDevice::pushPeriodMs() const
{
    lock_();
    const uint32_t v = pushPeriodMs_;
    unlock_();
    return v;
}

// ---------------------------------------------------------------------------
// SimulatedDeviceClient
// ---------------------------------------------------------------------------

SimulatedDeviceClient::~SimulatedDeviceClient()
{
    if (!closed_->load()) {
        ErrorCode ignored = ErrorCode::None;
        close(&ignored);
    }
}

bool SimulatedDeviceClient::fetchStatus(DeviceStatus& out, uint32_t& maxAgeS, ErrorCode* err)
{
    if (closed_->load()) {
        setError(err, ErrorCode::ClientClosed);
        return false;
    }
    return dev_.fetch(out, maxAgeS, err);
}

std::unique_ptr<IStatusStream> SimulatedDeviceClient::observeStatus(ErrorCode* err)
{
    if (closed_->load()) {
        setError(err, ErrorCode::ClientClosed);
        return nullptr;
    }
    return std::unique_ptr<IStatusStream>(new SimulatedStatusStream(dev_, closed_));
}

bool SimulatedDeviceClient::setControlValue(const char* key, JsonVariantConst value, ErrorCode* err)
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

bool SimulatedDeviceClient::setControlValues(JsonObjectConst values, ErrorCode* err)
{
    if (closed_->load()) {
        setError(err, ErrorCode::ClientClosed);
        return false;
    }
    if (values.isNull() || values.size() == 0) {
        setError(err, ErrorCode::MissingValue);
        return false;
    }
    LOGD("write %u value(s)", (unsigned)values.size());
    return dev_.applyValues(values, err);
}

bool SimulatedDeviceClient::close(ErrorCode* err)
{
    if (closed_->exchange(true)) {
        setError(err, ErrorCode::ClientClosed);
        return false;
    }
    dev_.noteClose();
    return true;
}

// ---------------------------------------------------------------------------
// SimulatedDeviceClientFactory
// ---------------------------------------------------------------------------

std::shared_ptr<IDeviceClient> SimulatedDeviceClientFactory::open(const char* host, ErrorCode* err)
{
    if (!dev_.acceptOpen(host, err)) {
        LOGD("open refused (host=%s)", host ? host : "-");
        return nullptr;
    }
    return std::make_shared<SimulatedDeviceClient>(dev_);
}
