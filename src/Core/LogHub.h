#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Queue-based log hub for producers and consumers.
 *
 * Producers never block: when the queue is full the entry is dropped and
 * counted so the dispatcher can report the loss.
 */
class LogHub {
public:
    /** @brief Initialize the log queue with a given length. */
    bool init(int queueLen = 32);

    /** @brief Enqueue a log entry (non-blocking). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief Entries dropped because the queue was full. */
    uint32_t dropped() const { return dropped_; }
    /** @brief Read and clear the dropped counter. */
    uint32_t takeDropped();

private:
    QueueHandle_t q = nullptr;
    volatile uint32_t dropped_ = 0;
    portMUX_TYPE mux_ = portMUX_INITIALIZER_UNLOCKED;
};
