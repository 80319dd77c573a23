#include "timer_scheduler.h"
#include "logger.h"

ThreadTimerScheduler::ThreadTimerScheduler() : m_state(std::make_shared<State>()) {
    m_worker = std::thread(&ThreadTimerScheduler::run, m_state);
}

ThreadTimerScheduler::~ThreadTimerScheduler() {
    stop();
}

ITimerScheduler::TimePoint ThreadTimerScheduler::now() const {
    return Clock::now();
}

TimerId ThreadTimerScheduler::schedule(std::chrono::milliseconds delay, Callback cb) {
    return scheduleRepeating(delay, std::chrono::milliseconds(0), std::move(cb));
}

TimerId ThreadTimerScheduler::scheduleRepeating(std::chrono::milliseconds initial,
                                                std::chrono::milliseconds period,
                                                Callback cb) {
    if (initial.count() < 0) initial = std::chrono::milliseconds(0);
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->stopping) {
            LOG_DEBUG("Timers: schedule ignored, scheduler stopped");
            return kInvalidTimer;
        }
        id = m_state->table.add(Clock::now() + initial, period, std::move(cb));
    }
    m_state->cv.notify_one();
    return id;
}

bool ThreadTimerScheduler::cancel(TimerId id) {
    if (id == kInvalidTimer) return false;
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->table.remove(id);
}

void ThreadTimerScheduler::stop() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopping = true;
        m_state->table.clear();
    }
    m_state->cv.notify_all();

    if (!m_worker.joinable()) {
        return;
    }
    if (m_worker.get_id() == std::this_thread::get_id()) {
        // Called from inside a callback; the worker owns its own reference to the state.
        m_worker.detach();
    } else {
        m_worker.join();
    }
}

void ThreadTimerScheduler::run(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stopping) {
        TimePoint next;
        if (!state->table.nextDue(next)) {
            state->cv.wait(lock);
            continue;
        }
        if (next > Clock::now()) {
            state->cv.wait_until(lock, next);
            continue;
        }

        TimePoint due;
        std::shared_ptr<Callback> cb;
        if (!state->table.popDue(Clock::now(), due, cb)) {
            continue;
        }
        lock.unlock();
        if (cb && *cb) {
            (*cb)();
        }
        lock.lock();
    }
}
