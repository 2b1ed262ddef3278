#include "sim/timer_queue.hpp"

#include <algorithm>

namespace salvo::sim {

CancelToken TimerQueue::scheduleCallback(TimeMs delayMs, std::function<void()> callback) {
    const CancelToken token = m_nextToken++;
    const TimeMs due = m_now + std::max(0.0, delayMs);
    m_timers.emplace(Key{due, token}, std::move(callback));
    m_dueTimes.emplace(token, due);
    return token;
}

bool TimerQueue::cancel(CancelToken token) {
    auto it = m_dueTimes.find(token);
    if (it == m_dueTimes.end()) {
        return false;
    }
    m_timers.erase(Key{it->second, token});
    m_dueTimes.erase(it);
    return true;
}

void TimerQueue::advance(TimeMs deltaMs) {
    const TimeMs target = m_now + std::max(0.0, deltaMs);

    while (!m_timers.empty()) {
        auto it = m_timers.begin();
        if (it->first.first > target) {
            break;
        }

        m_now = it->first.first;
        auto callback = std::move(it->second);
        m_dueTimes.erase(it->first.second);
        m_timers.erase(it);

        if (callback) {
            callback();
        }
    }

    m_now = target;
}

void TimerQueue::clear() {
    m_timers.clear();
    m_dueTimes.clear();
}

} // namespace salvo::sim
