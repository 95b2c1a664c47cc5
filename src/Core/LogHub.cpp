/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"
#define LOG_TAG_CORE "LogHubMg"

bool LogHub::init(int queueLen) {
    if (q) return true;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    if (xQueueSend(q, &e, 0) == pdTRUE) return true;  ///< 0 => non-blocking
    portENTER_CRITICAL(&mux_);
    ++dropped_;
    portEXIT_CRITICAL(&mux_);
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}

uint32_t LogHub::takeDropped() {
    portENTER_CRITICAL(&mux_);
    const uint32_t n = dropped_;
    dropped_ = 0;
    portEXIT_CRITICAL(&mux_);
    return n;
}
