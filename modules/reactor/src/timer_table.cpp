#include "timer_scheduler.h"

TimerId TimerTable::add(ITimerScheduler::TimePoint due, std::chrono::milliseconds period, ITimerScheduler::Callback cb) {
    const TimerId id = m_next_id++;
    Entry entry;
    entry.due = due;
    entry.period = period.count() > 0 ? period : std::chrono::milliseconds(0);
    entry.cb = std::make_shared<ITimerScheduler::Callback>(std::move(cb));
    m_entries.emplace(id, std::move(entry));
    return id;
}

bool TimerTable::remove(TimerId id) {
    return m_entries.erase(id) > 0;
}

bool TimerTable::popDue(ITimerScheduler::TimePoint limit, ITimerScheduler::TimePoint& due_out,
                        std::shared_ptr<ITimerScheduler::Callback>& cb_out) {
    auto best = m_entries.end();
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->second.due > limit) {
            continue;
        }
        // std::map iterates in id order, so strict '<' keeps the lowest id on ties.
        if (best == m_entries.end() || it->second.due < best->second.due) {
            best = it;
        }
    }
    if (best == m_entries.end()) {
        return false;
    }

    due_out = best->second.due;
    cb_out = best->second.cb;
    if (best->second.period.count() > 0) {
        best->second.due += best->second.period;
    } else {
        m_entries.erase(best);
    }
    return true;
}

bool TimerTable::nextDue(ITimerScheduler::TimePoint& due_out) const {
    bool found = false;
    for (const auto& kv : m_entries) {
        if (!found || kv.second.due < due_out) {
            due_out = kv.second.due;
            found = true;
        }
    }
    return found;
}
