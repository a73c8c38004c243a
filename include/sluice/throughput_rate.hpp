#ifndef SLUICE_THROUGHPUT_RATE_HEADER
#define SLUICE_THROUGHPUT_RATE_HEADER

#include "time.hpp"

#include <cstdint>

namespace sluice {

/**
 * An exponential moving average of bytes per second. Samples may be added at
 * irregular intervals, since the time elapsed since the last full second is taken
 * into account. The rate is recalculated once per second: bytes of a second that has
 * not yet elapsed are buffered until then, so it's not meant for finer granularity.
 *
 * Every function takes the current time, which defaults to `clock::now()`. The time
 * points passed must not go back in time.
 *
 * Not thread-safe.
 */
class throughput_rate
{
    // Aligned to full seconds since the starting point.
    mutable time_point last_update_time_;

    // The bytes of the second that has not elapsed yet.
    mutable int64_t accumulator_ = 0;
    mutable int64_t rate_ = 0;
    mutable int64_t peak_ = 0;

public:

    explicit throughput_rate(const time_point start = clock::now())
        : last_update_time_(start)
    {}

    void clear(const time_point now = clock::now()) noexcept
    {
        last_update_time_ = now;
        accumulator_ = rate_ = peak_ = 0;
    }

    /** Records that `num_bytes` bytes were transferred at `now`. */
    void update(const int64_t num_bytes, const time_point now = clock::now()) noexcept
    {
        update_impl(num_bytes, now);
    }

    int64_t rate(const time_point now = clock::now()) const noexcept
    {
        // if no update occurred in more than a second, nothing was transferred since
        update_impl(0, now);
        if(rate_ > peak_) {
            peak_ = rate_;
        }
        return rate_;
    }

    int64_t peak(const time_point now = clock::now()) const noexcept
    {
        rate(now);
        return peak_;
    }

private:

    void update_impl(const int64_t num_bytes, const time_point now) const noexcept
    {
        const auto elapsed = duration_cast<seconds>(now - last_update_time_);
        if(elapsed < seconds(1)) {
            accumulator_ += num_bytes;
            return;
        }
        // the first elapsed second gets what was accumulated, the rest had no
        // throughput at all (there's no point going on once the rate reached 0)
        update_rate(accumulator_);
        for(auto i = 1; (i < elapsed.count()) && (rate_ > 0); ++i) {
            update_rate(0);
        }
        accumulator_ = num_bytes;
        // keep update time points aligned to full seconds
        last_update_time_ += elapsed;
    }

    void update_rate(const int64_t value) const noexcept
    {
        rate_ = (rate_ * 3 + value * 2) / 5;
    }
};

} // namespace sluice

#endif // SLUICE_THROUGHPUT_RATE_HEADER
