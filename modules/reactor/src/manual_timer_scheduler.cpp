#include "timer_scheduler.h"

ManualTimerScheduler::ManualTimerScheduler() : m_now(Clock::time_point{} + std::chrono::hours(1)) {}

ITimerScheduler::TimePoint ManualTimerScheduler::now() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now;
}

TimerId ManualTimerScheduler::schedule(std::chrono::milliseconds delay, Callback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);
    return m_table.add(m_now + delay, std::chrono::milliseconds(0), std::move(cb));
}

TimerId ManualTimerScheduler::scheduleRepeating(std::chrono::milliseconds initial,
                                                std::chrono::milliseconds period,
                                                Callback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (initial.count() < 0) initial = std::chrono::milliseconds(0);
    return m_table.add(m_now + initial, period, std::move(cb));
}

bool ManualTimerScheduler::cancel(TimerId id) {
    if (id == kInvalidTimer) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.remove(id);
}

void ManualTimerScheduler::advance(std::chrono::milliseconds delta) {
    TimePoint target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        target = m_now + (delta.count() > 0 ? delta : std::chrono::milliseconds(0));
    }

    for (;;) {
        std::shared_ptr<Callback> cb;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            TimePoint due;
            if (!m_table.popDue(target, due, cb)) {
                m_now = target;
                return;
            }
            if (due > m_now) {
                m_now = due;
            }
        }
        if (cb && *cb) {
            (*cb)();
        }
    }
}

void ManualTimerScheduler::runPending() {
    advance(std::chrono::milliseconds(0));
}

size_t ManualTimerScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.size();
}
