#ifndef TIMER_SCHEDULER_H
#define TIMER_SCHEDULER_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

/**
 * @brief Cancellable one-shot and repeating timers.
 *
 * Callbacks are invoked without any scheduler lock held, so they may freely
 * schedule or cancel timers. cancel() removes a timer that has not started;
 * a callback that is already executing runs to completion.
 */
class ITimerScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Callback = std::function<void()>;

    virtual ~ITimerScheduler() = default;

    virtual TimePoint now() const = 0;

    virtual TimerId schedule(std::chrono::milliseconds delay, Callback cb) = 0;

    // First firing after `initial`, then every `period` until cancelled.
    // A non-positive period degrades to a one-shot timer.
    virtual TimerId scheduleRepeating(std::chrono::milliseconds initial,
                                      std::chrono::milliseconds period,
                                      Callback cb) = 0;

    // Returns true if the timer was still pending.
    virtual bool cancel(TimerId id) = 0;
};

// Shared bookkeeping of both schedulers.
class TimerTable {
public:
    struct Entry {
        ITimerScheduler::TimePoint due;
        std::chrono::milliseconds period{0};
        std::shared_ptr<ITimerScheduler::Callback> cb;
    };

    TimerId add(ITimerScheduler::TimePoint due, std::chrono::milliseconds period, ITimerScheduler::Callback cb);
    bool remove(TimerId id);

    // Earliest timer due at or before `limit`, ties broken by id.
    // Repeating timers are re-armed, one-shots removed. Returns false when none is due.
    bool popDue(ITimerScheduler::TimePoint limit, ITimerScheduler::TimePoint& due_out,
                std::shared_ptr<ITimerScheduler::Callback>& cb_out);

    bool nextDue(ITimerScheduler::TimePoint& due_out) const;
    size_t size() const { return m_entries.size(); }
    void clear() { m_entries.clear(); }

private:
    TimerId m_next_id = 1;
    std::map<TimerId, Entry> m_entries;
};

/**
 * @brief Virtual clock scheduler. Time only moves through advance().
 */
class ManualTimerScheduler : public ITimerScheduler {
public:
    ManualTimerScheduler();

    TimePoint now() const override;
    TimerId schedule(std::chrono::milliseconds delay, Callback cb) override;
    TimerId scheduleRepeating(std::chrono::milliseconds initial,
                              std::chrono::milliseconds period,
                              Callback cb) override;
    bool cancel(TimerId id) override;

    // Moves the clock forward, firing every timer that comes due on the way
    // (including timers scheduled by callbacks) in due-time order.
    void advance(std::chrono::milliseconds delta);

    // Fires everything already due without moving the clock.
    void runPending();

    size_t pendingCount() const;

private:
    mutable std::mutex m_mutex;
    TimePoint m_now;
    TimerTable m_table;
};

/**
 * @brief Real-time scheduler backed by one worker thread.
 */
class ThreadTimerScheduler : public ITimerScheduler {
public:
    ThreadTimerScheduler();
    ~ThreadTimerScheduler() override;

    TimePoint now() const override;
    TimerId schedule(std::chrono::milliseconds delay, Callback cb) override;
    TimerId scheduleRepeating(std::chrono::milliseconds initial,
                              std::chrono::milliseconds period,
                              Callback cb) override;
    bool cancel(TimerId id) override;

    // Drops pending timers and joins the worker. Safe to call from a callback.
    void stop();

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        TimerTable table;
        bool stopping = false;
    };

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state;
    std::thread m_worker;
    std::mutex m_lifecycle_mutex;
};

#endif // TIMER_SCHEDULER_H
