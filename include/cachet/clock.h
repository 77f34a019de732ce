#ifndef CACHET_CLOCK_H
#define CACHET_CLOCK_H

#include <atomic>
#include <chrono>
#include <memory>

namespace cachet {

/// @brief Monotonic time point used for every entry timestamp.
using TimePoint = std::chrono::steady_clock::time_point;

/// @brief Duration type used for TTLs and clock arithmetic.
using Duration = std::chrono::nanoseconds;

/// @brief Default clock, backed by `std::chrono::steady_clock`.
struct SteadyClock {
    [[nodiscard]] TimePoint now() const
    {
        return std::chrono::steady_clock::now();
    }
};

/// @brief Manually driven clock.
/// @details Copies share the same instant, so a test can keep one copy and hand another to a cache.
///          Time only moves when `advance()` is called.
class ManualClock
{
public:
    ManualClock() : m_elapsed{std::make_shared<std::atomic<Duration::rep>>(0)}
    {
    }

    [[nodiscard]] TimePoint now() const
    {
        return TimePoint{std::chrono::duration_cast<TimePoint::duration>(Duration{m_elapsed->load()})};
    }

    /// @brief Move the clock forward.
    /// @param delta How much time should pass. Negative values are ignored.
    void advance(Duration delta)
    {
        if (delta.count() > 0) {
            m_elapsed->fetch_add(delta.count());
        }
    }

private:
    std::shared_ptr<std::atomic<Duration::rep>> m_elapsed;
};

}  // namespace cachet

#endif
