/**
 * @file LivenessTimer.cpp
 * @brief Implementation file.
 */
#include "Core/LivenessTimer.h"
#include "Core/Log.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

#define LOG_TAG_CORE "LiveTmr"

static TickType_t msToTicks(uint32_t ms)
{
    const TickType_t t = pdMS_TO_TICKS(ms);
    return (t == 0) ? 1 : t;
}

// Timer commands issued from the timer service task itself must not block.
static TickType_t commandWait()
{
    return (xTaskGetCurrentTaskHandle() == xTimerGetTimerDaemonTaskHandle()) ? 0 : pdMS_TO_TICKS(100);
}

static void releaseSemaphore(void* sem, uint32_t)
{
    xSemaphoreGive(static_cast<SemaphoreHandle_t>(sem));
}

LivenessTimer::LivenessTimer(const char* name, uint32_t timeoutMs, Callback cb, void* ctx,
                             bool autostart, bool autoRearm)
    : cb_(cb), ctx_(ctx), autoRearm_(autoRearm), timeoutMs_(timeoutMs)
{
    timer_ = xTimerCreate(name ? name : "Liveness", msToTicks(timeoutMs), pdFALSE, this, &LivenessTimer::onExpire_);
    if (!timer_) {
        Log::error(LOG_TAG_CORE, "xTimerCreate failed (%s)", name ? name : "-");
        return;
    }
    if (autostart) start();
}

LivenessTimer::~LivenessTimer()
{
    if (!timer_) return;
    cancel();
    const bool inDaemon = (xTaskGetCurrentTaskHandle() == xTimerGetTimerDaemonTaskHandle());
    xTimerDelete(timer_, inDaemon ? 0 : portMAX_DELAY);
    timer_ = nullptr;
    drain();
}

bool LivenessTimer::arm_()
{
    if (!timer_) return false;

    portENTER_CRITICAL(&mux_);
    const TickType_t period = msToTicks(timeoutMs_);
    deadline_ = xTaskGetTickCount() + period;
    armed_ = true;
    ++generation_;
    portEXIT_CRITICAL(&mux_);

    // Restarts the countdown from now, whether or not one is pending.
    if (xTimerChangePeriod(timer_, period, commandWait()) != pdPASS) {
        Log::warn(LOG_TAG_CORE, "timer command queue full, countdown not armed");
        portENTER_CRITICAL(&mux_);
        armed_ = false;
        portEXIT_CRITICAL(&mux_);
        return false;
    }
    return true;
}

void LivenessTimer::drain()
{
    if (xTaskGetCurrentTaskHandle() == xTimerGetTimerDaemonTaskHandle()) return;

    // Commands are processed in order: once this call runs, every callback
    // queued before it has returned.
    SemaphoreHandle_t done = xSemaphoreCreateBinary();
    if (!done) return;
    if (xTimerPendFunctionCall(releaseSemaphore, done, 0, pdMS_TO_TICKS(100)) == pdPASS) {
        xSemaphoreTake(done, pdMS_TO_TICKS(1000));
    }
    vSemaphoreDelete(done);
}

bool LivenessTimer::start()
{
    return arm_();
}

bool LivenessTimer::reset()
{
    return arm_();
}

void LivenessTimer::setTimeout(uint32_t timeoutMs)
{
    portENTER_CRITICAL(&mux_);
    timeoutMs_ = timeoutMs;
    portEXIT_CRITICAL(&mux_);
}

bool LivenessTimer::cancel()
{
    if (!timer_) return false;

    portENTER_CRITICAL(&mux_);
    armed_ = false;
    ++generation_;
    portEXIT_CRITICAL(&mux_);

    return xTimerStop(timer_, commandWait()) == pdPASS;
}

bool LivenessTimer::isActive() const
{
    portENTER_CRITICAL(&mux_);
    const bool v = armed_;
    portEXIT_CRITICAL(&mux_);
    return v;
}

uint32_t LivenessTimer::timeoutMs() const
{
    portENTER_CRITICAL(&mux_);
    const uint32_t v = timeoutMs_;
    portEXIT_CRITICAL(&mux_);
    return v;
}

uint32_t LivenessTimer::fireCount() const
{
    portENTER_CRITICAL(&mux_);
    const uint32_t v = fires_;
    portEXIT_CRITICAL(&mux_);
    return v;
}

void LivenessTimer::onExpire_(TimerHandle_t t)
{
    LivenessTimer* self = static_cast<LivenessTimer*>(pvTimerGetTimerID(t));
    if (self) self->expire_();
}

void LivenessTimer::expire_()
{
    bool fire = false;
    uint32_t gen = 0;

    portENTER_CRITICAL(&mux_);
    // A reset moves the deadline forward: an expiry from the replaced
    // countdown sees now < deadline_ and is dropped.
    if (armed_ && (int32_t)(xTaskGetTickCount() - deadline_) >= 0) {
        armed_ = false;
        fire = true;
        gen = ++generation_;
        ++fires_;
    }
    portEXIT_CRITICAL(&mux_);

    if (!fire) return;
    if (cb_) cb_(ctx_);

    if (!autoRearm_) return;

    // Re-arm unless the callback (or another task) reset or cancelled meanwhile.
    portENTER_CRITICAL(&mux_);
    const bool rearm = !armed_ && generation_ == gen;
    portEXIT_CRITICAL(&mux_);
    if (rearm) arm_();
}
