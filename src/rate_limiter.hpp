#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sorter {

// Token bucket handing out one permit per interval, holding at most
// `burst` permits. Callers are delayed, never rejected, until cancel().
class rate_limiter {
public:
    using clock = std::chrono::steady_clock;

    explicit rate_limiter(std::chrono::milliseconds interval, unsigned int burst = 1);

    // Block until a permit is available. Returns false if the limiter was
    // cancelled before or while waiting.
    bool acquire();

    // Wake all waiters and make every later acquire() fail.
    void cancel();

    bool cancelled() const;

    std::chrono::milliseconds interval() const { return m_interval; }

private:
    void refill(clock::time_point now);

    const std::chrono::milliseconds m_interval;
    const double m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    double m_tokens;
    clock::time_point m_last_refill;
    bool m_cancelled = false;
};

} // namespace sorter
