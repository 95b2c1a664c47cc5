#pragma once
/**
 * @file LivenessTimer.h
 * @brief Restartable countdown that fires a callback once per expiry.
 */
#include <stdint.h>
#include "freertos/FreeRTOS.h"
#include "freertos/timers.h"

/**
 * @brief One-shot FreeRTOS software timer with reset suppression and optional auto-rearm.
 *
 * - start()/reset() arm a countdown of the current timeout; a countdown
 *   already pending is replaced.
 * - A reset that lands before the callback starts prevents that callback.
 * - With auto-rearm a new countdown starts right after each callback.
 * - setTimeout() applies to the next countdown only.
 *
 * The callback runs in the timer service task and must not block.
 */
class LivenessTimer {
public:
    using Callback = void (*)(void* ctx);

    LivenessTimer(const char* name, uint32_t timeoutMs, Callback cb, void* ctx,
                  bool autostart = false, bool autoRearm = false);
    ~LivenessTimer();

    LivenessTimer(const LivenessTimer&) = delete;
    LivenessTimer& operator=(const LivenessTimer&) = delete;

    /** @brief Arm a countdown of the current timeout. */
    bool start();
    /** @brief Cancel any pending countdown and start a fresh one. */
    bool reset();
    /** @brief Change the duration used by future countdowns. */
    void setTimeout(uint32_t timeoutMs);
    /** @brief Stop any pending countdown; inert until start()/reset(). */
    bool cancel();
    /** @brief Wait until a callback already running in the timer task has returned. */
    void drain();

    bool isActive() const;
    uint32_t timeoutMs() const;
    bool autoRearm() const { return autoRearm_; }
    /** @brief Number of callbacks delivered so far. */
    uint32_t fireCount() const;

private:
    static void onExpire_(TimerHandle_t t);
    void expire_();
    bool arm_();

    TimerHandle_t timer_ = nullptr;
    Callback cb_ = nullptr;
    void* ctx_ = nullptr;
    const bool autoRearm_;

    mutable portMUX_TYPE mux_ = portMUX_INITIALIZER_UNLOCKED;
    uint32_t timeoutMs_ = 0;
    TickType_t deadline_ = 0;
    uint32_t generation_ = 0;
    uint32_t fires_ = 0;
    bool armed_ = false;
};
