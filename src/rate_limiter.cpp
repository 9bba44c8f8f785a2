#include "rate_limiter.hpp"
#include <algorithm>

namespace sorter {

rate_limiter::rate_limiter(std::chrono::milliseconds interval, unsigned int burst)
    : m_interval(interval),
      m_capacity(burst > 0 ? static_cast<double>(burst) : 1.0),
      m_tokens(m_capacity),
      m_last_refill(clock::now())
{}

void rate_limiter::refill(clock::time_point now) {
    if (m_interval.count() <= 0) {
        m_tokens = m_capacity;
        m_last_refill = now;
        return;
    }

    const auto dt = std::chrono::duration<double, std::milli>(now - m_last_refill).count();
    if (dt <= 0.0) return;

    m_tokens = std::min(m_capacity, m_tokens + dt / static_cast<double>(m_interval.count()));
    m_last_refill = now;
}

bool rate_limiter::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (m_cancelled) return false;

        const auto now = clock::now();
        refill(now);

        if (m_tokens >= 1.0) {
            m_tokens -= 1.0;
            return true;
        }

        // Time until the missing fraction of a token has accumulated.
        const auto wait = std::chrono::duration<double, std::milli>(
            (1.0 - m_tokens) * static_cast<double>(m_interval.count()));
        m_cv.wait_until(lock, now + std::chrono::ceil<clock::duration>(wait));
    }
}

void rate_limiter::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool rate_limiter::cancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

} // namespace sorter
