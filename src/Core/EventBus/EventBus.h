#pragma once
/**
 * @file EventBus.h
 * @brief Simple queued event bus with fixed-size payloads.
 */
#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "EventId.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#ifndef AIRLINK_EVENTBUS_PROFILE
#define AIRLINK_EVENTBUS_PROFILE 1
#endif

#ifndef AIRLINK_EVENTBUS_HANDLER_WARN_US
#define AIRLINK_EVENTBUS_HANDLER_WARN_US 5000
#endif

#ifndef AIRLINK_EVENTBUS_WARN_MIN_INTERVAL_MS
#define AIRLINK_EVENTBUS_WARN_MIN_INTERVAL_MS 2000
#endif

/** @brief Event delivered to subscribers during dispatch(). */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

/** @brief Callback signature for event subscribers. */
using EventCallback = void(*)(const Event& e, void* user);

/**
 * @brief Thread-safe event queue with subscriber dispatch.
 *
 * post() may be called from any task. subscribe() is meant for init time,
 * before the dispatch task runs.
 */
class EventBus {
public:
    static constexpr uint16_t MAX_SUBSCRIBERS = 16;

    // Maximum payload size copied into internal queue.
    static constexpr uint8_t MAX_PAYLOAD_SIZE = 48;

    // Maximum number of queued events (FreeRTOS queue length).
    static constexpr uint8_t QUEUE_LENGTH = Limits::EventQueueLen;

    /** @brief Construct and initialize the event queue. */
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /** @brief Subscribe to an event id. */
    bool subscribe(EventId id, EventCallback cb, void* user);

    /** @brief Post an event from any task; payload is copied into the queue. */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);

    /** @brief Dispatch up to maxEvents queued events. Returns how many ran. */
    uint16_t dispatch(uint16_t maxEvents = 8);

    /** @brief Events rejected because the queue was full. */
    uint32_t dropped() const { return _dropped; }

private:
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct QueuedEvent {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD_SIZE];
    };

    Subscriber _subs[MAX_SUBSCRIBERS];
    uint16_t _count = 0;
    volatile uint32_t _dropped = 0;

    QueueHandle_t _queue = nullptr;

    void dispatchOne(const QueuedEvent& qe);
};
