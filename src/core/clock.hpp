#pragma once
#include <chrono>
#include <ctime>
#include <string>

/**
 * @brief Scan-cycle scheduler
 *
 * Keeps the next due time anchored to the previous one (next += period) so
 * that a slow scan does not push every later cycle back. If a scan overran a
 * whole period the schedule is re-anchored to now instead of firing a burst
 * of catch-up cycles.
 */
struct ScanClock {
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds period;
    clock::time_point next;

    /**
     * @brief First cycle is due immediately
     * @param p Period between scan cycles
     */
    explicit ScanClock(std::chrono::nanoseconds p)
        : period(p), next(clock::now()) {}

    /// True once the next cycle is due
    bool due() const {
        return clock::now() >= next;
    }

    /**
     * @brief Mark the current cycle as taken and schedule the next one
     */
    void advance() {
        next += period;
        auto now = clock::now();
        if (next < now) {
            next = now + period;
        }
    }

    /**
     * @brief Start over with a new period, first cycle due immediately
     */
    void reset(std::chrono::nanoseconds new_period) {
        period = new_period;
        next = clock::now();
    }

    /**
     * @brief Time until the next cycle is due (zero if overdue)
     */
    std::chrono::nanoseconds time_to_next() const {
        auto now = clock::now();
        if (next <= now) {
            return std::chrono::nanoseconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(next - now);
    }
};

/**
 * @brief Local calendar date as YYYY-MM-DD
 */
inline std::string iso_date(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}
