#pragma once
/**
 * @file SimulatedDeviceClient.h
 * @brief In-memory device and client used on the bench and by tests.
 */
#include <atomic>
#include <memory>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include "Modules/Device/Client/IDeviceClient.h"

/**
 * @brief Simulated air purifier: holds a status record and pushes it to observers.
 *
 * Streams emit an update whenever the status changes and, while pushPeriodMs
 * is non-zero, re-send the current status at that period. Fault switches let
 * tests break each stage of the link.
 */
class SimulatedDevice {
public:
    SimulatedDevice();
    ~SimulatedDevice();

    SimulatedDevice(const SimulatedDevice&) = delete;
    SimulatedDevice& operator=(const SimulatedDevice&) = delete;

    /** @brief Only accept opens for this host (empty = any host). */
    void setHost(const char* host);
    /** @brief Replace the whole status record and notify observers. */
    bool setStatus(const char* json);
    /** @brief Merge attributes into the status record and notify observers. */
    bool applyValues(JsonObjectConst values, ErrorCode* err);
    void setMaxAgeS(uint32_t s);
    void setPushPeriodMs(uint32_t ms);

    // Fault injection
    void failNextOpens(uint8_t n);
    void failNextFetches(uint8_t n);
    /** @brief Delay every open by ms (0 = immediate). */
    void setOpenDelayMs(uint32_t ms);
    void setStalled(bool stalled);
    void setFailWrites(bool fail);
    /** @brief End every stream opened so far. */
    void endStreams();

    // Inspection
    uint32_t opens() const;
    uint32_t closes() const;
    uint32_t writes() const;
    uint32_t statusSeq() const;
    bool copyStatus(DeviceStatus& out) const;
    /** @brief Copy status and its sequence number in one step. */
    bool snapshot(DeviceStatus& out, uint32_t& seq) const;

    // Used by clients/streams
    bool acceptOpen(const char* host, ErrorCode* err);
    bool fetch(DeviceStatus& out, uint32_t& maxAgeS, ErrorCode* err);
    void noteClose();
    uint32_t streamEpoch() const;
    bool stalled() const;
    uint32_t pushPeriodMs() const;

private:
    mutable SemaphoreHandle_t mutex_ = nullptr;
    char host_[Limits::Device::Host] = {0};
    DeviceStatus status_;
    uint32_t seq_ = 0;
    uint32_t maxAgeS_ = Limits::Device::DefaultMaxAgeS;
    uint32_t pushPeriodMs_ = 0;
    uint32_t openDelayMs_ = 0;
    uint32_t streamEpoch_ = 0;
    uint8_t failOpens_ = 0;
    uint8_t failFetches_ = 0;
    bool stalled_ = false;
    bool failWrites_ = false;
    uint32_t opens_ = 0;
    uint32_t closes_ = 0;
    uint32_t writes_ = 0;

    void lock_() const;
    void unlock_() const;
};

/**
 * @brief IDeviceClient bound to a SimulatedDevice.
 */
class SimulatedDeviceClient : public IDeviceClient {
public:
    explicit SimulatedDeviceClient(SimulatedDevice& dev)
        : dev_(dev), closed_(std::make_shared<std::atomic<bool>>(false)) {}
    ~SimulatedDeviceClient() override;

    bool fetchStatus(DeviceStatus& out, uint32_t& maxAgeS, ErrorCode* err) override;
    std::unique_ptr<IStatusStream> observeStatus(ErrorCode* err) override;
    bool setControlValue(const char* key, JsonVariantConst value, ErrorCode* err) override;
    bool setControlValues(JsonObjectConst values, ErrorCode* err) override;
    bool close(ErrorCode* err) override;

    bool isClosed() const { return closed_->load(); }

private:
    SimulatedDevice& dev_;
    std::shared_ptr<std::atomic<bool>> closed_;  // shared with streams
};

/** @brief Factory opening SimulatedDeviceClient instances. */
class SimulatedDeviceClientFactory : public IDeviceClientFactory {
public:
    explicit SimulatedDeviceClientFactory(SimulatedDevice& dev) : dev_(dev) {}
    std::shared_ptr<IDeviceClient> open(const char* host, ErrorCode* err) override;

private:
    SimulatedDevice& dev_;
};
